#include <loregraph/graph/alias_utils.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace loregraph::graph {

namespace {

bool isTokenByte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c) || c == '_' || c == '-';
}

} // namespace

std::string normalizeAlias(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    bool pendingSpace = false;
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '[':
            case ']':
            case '(':
            case ')':
            case '{':
            case '}':
                c = ' ';
                break;
            default:
                break;
        }
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::vector<std::string> tokenizeAliasText(std::string_view normalized) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : normalized) {
        if (isTokenByte(static_cast<unsigned char>(ch))) {
            current.push_back(ch);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::vector<std::string> generateCandidateAliasTerms(const std::string& normalizedQuery) {
    std::vector<std::string> terms;
    std::unordered_set<std::string> seen;
    auto add = [&](std::string term) {
        if (seen.insert(term).second) {
            terms.push_back(std::move(term));
        }
    };

    add(normalizedQuery);

    auto tokens = tokenizeAliasText(normalizedQuery);
    if (tokens.size() > kMaxQueryTokens) {
        tokens.resize(kMaxQueryTokens);
    }

    for (std::size_t n = std::min(kMaxAliasNgram, tokens.size()); n >= 1; --n) {
        for (std::size_t i = 0; i + n <= tokens.size(); ++i) {
            std::string phrase = tokens[i];
            for (std::size_t k = i + 1; k < i + n; ++k) {
                phrase.push_back(' ');
                phrase += tokens[k];
            }
            if (phrase.size() >= 2) {
                add(std::move(phrase));
            }
        }
    }
    return terms;
}

double computeTermScore(std::string_view term) {
    std::size_t tokenCount = 0;
    // Length in code points; UTF-8 continuation bytes are not counted
    std::size_t length = 0;
    bool inToken = false;
    for (char c : term) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++length;
        }
        if (c == ' ') {
            inToken = false;
        } else if (!inToken) {
            inToken = true;
            ++tokenCount;
        }
    }
    return static_cast<double>(tokenCount) * 10.0 +
           std::min(10.0, static_cast<double>(length) / 4.0);
}

} // namespace loregraph::graph
