#pragma once

#include <qms/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace qms::search {

/**
 * @brief Sorted, deduplicated set of normalized tokens.
 */
using TokenSet = std::vector<std::string>;

/**
 * @brief Text normalizer shared by queries and movie text
 *
 * Lower-cases ASCII letters and splits on every byte that is not an ASCII
 * alphanumeric. Bytes >= 0x80 stay inside tokens so UTF-8 words such as
 * "amélie" survive as one token.
 */
class QueryTokenizer {
public:
    /**
     * @brief Tokenize text into a sorted token set
     */
    TokenSet tokenize(std::string_view text) const;

    /**
     * @brief Tokenize a query, failing with InvalidQuery on an empty token set
     */
    Result<TokenSet> normalizeQuery(std::string_view query) const;

    /**
     * @brief Check whether a token set contains a token
     */
    static bool contains(const TokenSet& tokens, const std::string& token);

    /**
     * @brief Lower-case and trim text without splitting it
     */
    static std::string normalizeTitle(std::string_view text);

private:
    static bool isTokenChar(unsigned char c);
};

} // namespace qms::search
