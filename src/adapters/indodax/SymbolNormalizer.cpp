#include "adapters/indodax/SymbolNormalizer.hpp"

#include <cctype>

namespace adapters::indodax {

std::string normalize_pair(std::string_view raw) {
    std::string lowered;
    lowered.reserve(raw.size() + 1);
    for (unsigned char ch : raw) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }

    const auto quotePos = lowered.find(kQuoteIdr);
    if (quotePos == std::string::npos || lowered.find('_') != std::string::npos) {
        return lowered;
    }

    // Only the first occurrence is the quote marker.
    std::string base = lowered.substr(0, quotePos) + lowered.substr(quotePos + kQuoteIdr.size());
    base.append("_").append(kQuoteIdr);
    return base;
}

}  // namespace adapters::indodax
