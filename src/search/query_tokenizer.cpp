#include <qms/search/query_tokenizer.h>

#include <algorithm>
#include <cctype>

namespace qms::search {

bool QueryTokenizer::isTokenChar(unsigned char c) {
    return c >= 0x80 || std::isalnum(c) != 0;
}

TokenSet QueryTokenizer::tokenize(std::string_view text) const {
    TokenSet tokens;
    std::string current;

    for (unsigned char c : text) {
        if (isTokenChar(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }

    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return tokens;
}

Result<TokenSet> QueryTokenizer::normalizeQuery(std::string_view query) const {
    auto tokens = tokenize(query);
    if (tokens.empty()) {
        return Error{ErrorCode::InvalidQuery, "query contains no searchable terms"};
    }
    return tokens;
}

bool QueryTokenizer::contains(const TokenSet& tokens, const std::string& token) {
    return std::binary_search(tokens.begin(), tokens.end(), token);
}

std::string QueryTokenizer::normalizeTitle(std::string_view text) {
    auto begin = std::find_if(text.begin(), text.end(),
                              [](unsigned char ch) { return !std::isspace(ch); });
    auto end = std::find_if(text.rbegin(), text.rend(), [](unsigned char ch) {
                   return !std::isspace(ch);
               }).base();

    std::string out;
    if (begin >= end) {
        return out;
    }
    out.reserve(static_cast<size_t>(end - begin));
    for (auto it = begin; it != end; ++it) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
    }
    return out;
}

} // namespace qms::search
