#ifndef INSTRUMENT_UTILS_HPP
#define INSTRUMENT_UTILS_HPP

#include <string>
#include "trader/data_structures/data_structures.hpp"

namespace IntradayTrader {
namespace Core {

// Parses SYMBOL-CURRENCY-TRADETYPE, throws InvalidInstrumentFormat or UnknownTradeType
Instrument parse_instrument(const std::string& instrument_text);
std::string format_instrument(const Instrument& instrument);

} // namespace Core
} // namespace IntradayTrader

#endif // INSTRUMENT_UTILS_HPP
