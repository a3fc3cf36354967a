#include "instrument_utils.hpp"
#include "trader/errors/trading_errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace IntradayTrader {
namespace Core {

Instrument parse_instrument(const std::string& instrument_text) {
    std::string normalized_text = instrument_text;
    std::transform(normalized_text.begin(), normalized_text.end(), normalized_text.begin(),
                   [](unsigned char text_character) { return static_cast<char>(std::toupper(text_character)); });

    std::vector<std::string> instrument_parts;
    std::stringstream instrument_stream(normalized_text);
    std::string instrument_part;
    while (std::getline(instrument_stream, instrument_part, '-')) {
        instrument_parts.push_back(instrument_part);
    }
    // getline drops a trailing empty field, so "A-B-" would otherwise pass as two parts
    if (!instrument_text.empty() && instrument_text.back() == '-') {
        instrument_parts.push_back("");
    }

    if (instrument_parts.size() != 3) {
        throw InvalidInstrumentFormat(instrument_text);
    }
    for (const std::string& part_value : instrument_parts) {
        if (part_value.empty()) {
            throw InvalidInstrumentFormat(instrument_text);
        }
    }

    Instrument parsed_instrument;
    parsed_instrument.symbol = instrument_parts[0];
    parsed_instrument.currency = instrument_parts[1];
    if (instrument_parts[2] == "SPOT") {
        parsed_instrument.trade_type = TradeType::SPOT;
    } else if (instrument_parts[2] == "PERP") {
        parsed_instrument.trade_type = TradeType::PERP;
    } else {
        throw InvalidInstrumentFormat(instrument_text);
    }
    return parsed_instrument;
}

std::string format_instrument(const Instrument& instrument) {
    return instrument.symbol + "-" + instrument.currency + "-" + to_string(instrument.trade_type);
}

} // namespace Core
} // namespace IntradayTrader
