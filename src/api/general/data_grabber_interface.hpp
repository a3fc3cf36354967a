#ifndef DATA_GRABBER_INTERFACE_HPP
#define DATA_GRABBER_INTERFACE_HPP

#include <string>
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace API {

/**
 * Historical bar source for one or more feeds.
 * An empty result means the fetch produced nothing usable; transport failures throw.
 */
class DataGrabberInterface {
public:
    virtual ~DataGrabberInterface() = default;

    // Bars ordered by ascending timestamp
    virtual Core::BarTable fetch_historical(const Core::HistoricalDataRequest& request) = 0;

    virtual std::string get_provider_name() const = 0;
};

} // namespace API
} // namespace IntradayTrader

#endif // DATA_GRABBER_INTERFACE_HPP
