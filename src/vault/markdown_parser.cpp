#include <loregraph/vault/markdown_parser.h>

#include <loregraph/common/pattern_utils.h>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <regex>
#include <string>
#include <vector>

namespace loregraph::vault {

namespace {

// Splits on '\n', dropping a trailing '\r' from each line. Offsets point past each line break.
struct Line {
    std::string_view text;
    size_t next = 0;
};

std::vector<Line> splitLines(std::string_view content) {
    std::vector<Line> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        const size_t next = end == std::string_view::npos ? content.size() : end + 1;
        if (end == std::string_view::npos)
            end = content.size();
        auto text = content.substr(start, end - start);
        if (!text.empty() && text.back() == '\r')
            text.remove_suffix(1);
        lines.push_back({text, next});
        start = next;
    }
    return lines;
}

bool isFrontmatterClose(std::string_view line) {
    const auto t = common::trim(line);
    return t == "---" || t == "...";
}

// ---------------------------------------------------------------------------
// YAML <-> JSON
// ---------------------------------------------------------------------------

const std::regex& integerPattern() {
    static const std::regex re(R"(^[-+]?[0-9]+$)");
    return re;
}

const std::regex& floatPattern() {
    static const std::regex re(R"(^[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?$)");
    return re;
}

bool isNullScalar(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> boolScalar(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE")
        return true;
    if (s == "false" || s == "False" || s == "FALSE")
        return false;
    return std::nullopt;
}

nlohmann::json plainScalarToJson(const std::string& raw) {
    if (isNullScalar(raw)) {
        return nullptr;
    }
    if (auto b = boolScalar(raw)) {
        return *b;
    }
    if (std::regex_match(raw, integerPattern())) {
        errno = 0;
        char* end = nullptr;
        const long long v = std::strtoll(raw.c_str(), &end, 10);
        if (errno == 0 && end == raw.c_str() + raw.size()) {
            return v;
        }
    }
    if (std::regex_match(raw, floatPattern())) {
        return std::strtod(raw.c_str(), nullptr);
    }
    return raw;
}

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            // Non-plain (quoted) scalars carry the "!" tag
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            return plainScalarToJson(node.Scalar());
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) {
                const auto key = kv.first.IsScalar() ? kv.first.Scalar() : YAML::Dump(kv.first);
                obj[key] = yamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

// Strings that would read back as something else need quoting.
bool needsQuoting(const std::string& s) {
    return isNullScalar(s) || boolScalar(s).has_value() || std::regex_match(s, integerPattern()) ||
           std::regex_match(s, floatPattern()) || common::trim(s).size() != s.size();
}

void emitJson(YAML::Emitter& out, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            out << YAML::Null;
            break;
        case nlohmann::json::value_t::boolean:
            out << value.get<bool>();
            break;
        case nlohmann::json::value_t::number_integer:
            out << value.get<std::int64_t>();
            break;
        case nlohmann::json::value_t::number_unsigned:
            out << value.get<std::uint64_t>();
            break;
        case nlohmann::json::value_t::number_float:
            out << value.get<double>();
            break;
        case nlohmann::json::value_t::string: {
            const auto& s = value.get_ref<const std::string&>();
            if (needsQuoting(s)) {
                out << YAML::DoubleQuoted << s;
            } else {
                out << s;
            }
            break;
        }
        case nlohmann::json::value_t::array:
            if (value.empty()) {
                out << YAML::Flow;
            }
            out << YAML::BeginSeq;
            for (const auto& item : value) {
                emitJson(out, item);
            }
            out << YAML::EndSeq;
            break;
        case nlohmann::json::value_t::object:
            if (value.empty()) {
                out << YAML::Flow;
            }
            out << YAML::BeginMap;
            for (const auto& [key, item] : value.items()) {
                out << YAML::Key << key << YAML::Value;
                emitJson(out, item);
            }
            out << YAML::EndMap;
            break;
        case nlohmann::json::value_t::binary:
            out << YAML::Null;
            break;
    }
}

// ---------------------------------------------------------------------------
// Body scanning
// ---------------------------------------------------------------------------

bool isTagChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '/' || c >= 0x80;
}

void appendUnique(std::vector<std::string>& out, std::string value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(std::move(value));
    }
}

void scanInlineTags(std::string_view line, std::vector<std::string>& tags) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] != '#')
            continue;
        if (i > 0) {
            const auto prev = static_cast<unsigned char>(line[i - 1]);
            if (!std::isspace(prev) && prev != '(' && prev != ',')
                continue;
        }
        size_t j = i + 1;
        while (j < line.size() && isTagChar(static_cast<unsigned char>(line[j])))
            ++j;
        auto tag = line.substr(i + 1, j - i - 1);
        const bool allDigits = std::all_of(tag.begin(), tag.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if (!tag.empty() && !allDigits) {
            appendUnique(tags, "#" + std::string(tag));
        }
        i = j > i ? j - 1 : i;
    }
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hexDigit(s[i + 1]);
            const int lo = hexDigit(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

bool isExternalTarget(std::string_view target) {
    return target.find("://") != std::string_view::npos || target.rfind("mailto:", 0) == 0 ||
           target.empty() || target.front() == '#';
}

void scanLinks(const std::string& line, std::vector<host::DocumentLink>& links) {
    static const std::regex wikiLink(R"(\[\[([^\]]+)\]\])");
    static const std::regex markdownLink(R"(\[([^\]]*)\]\(([^)]+)\))");

    for (auto it = std::sregex_iterator(line.begin(), line.end(), wikiLink);
         it != std::sregex_iterator(); ++it) {
        const std::string inner = (*it)[1].str();
        const auto bar = inner.find('|');
        std::string target(common::trim(std::string_view(inner).substr(0, bar)));
        // Tables escape the alias separator as "\|"
        if (!target.empty() && target.back() == '\\') {
            target.pop_back();
        }
        if (target.empty()) {
            continue;
        }
        host::DocumentLink link;
        link.target = std::move(target);
        if (bar != std::string::npos) {
            auto display = common::trim(std::string_view(inner).substr(bar + 1));
            if (!display.empty()) {
                link.displayText = std::string(display);
            }
        }
        links.push_back(std::move(link));
    }

    for (auto it = std::sregex_iterator(line.begin(), line.end(), markdownLink);
         it != std::sregex_iterator(); ++it) {
        // Skip the "[x]" inside "[[x]]"
        const auto pos = static_cast<size_t>(it->position(0));
        if (pos > 0 && line[pos - 1] == '[') {
            continue;
        }
        const std::string rawTarget = (*it)[2].str();
        auto raw = common::trim(rawTarget);
        if (raw.size() >= 2 && raw.front() == '<' && raw.back() == '>') {
            raw = raw.substr(1, raw.size() - 2);
        } else if (auto space = raw.find(' '); space != std::string_view::npos) {
            raw = raw.substr(0, space); // drop an optional "title"
        }
        if (isExternalTarget(raw)) {
            continue;
        }
        host::DocumentLink link;
        link.target = percentDecode(raw);
        const std::string rawText = (*it)[1].str();
        auto text = common::trim(rawText);
        if (!text.empty()) {
            link.displayText = std::string(text);
        }
        links.push_back(std::move(link));
    }
}

std::optional<std::string> parseHeading(std::string_view line) {
    static const std::regex heading(R"(^ {0,3}#{1,6}[ \t]+(.+?)(?:[ \t]+#+)?[ \t]*$)");
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(line.begin(), line.end(), m, heading)) {
        return std::nullopt;
    }
    auto text = common::trim(
        line.substr(static_cast<size_t>(m.position(1)), static_cast<size_t>(m.length(1))));
    if (text.empty()) {
        return std::nullopt;
    }
    return std::string(text);
}

std::string stripInlineCode(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    bool inCode = false;
    for (char c : line) {
        if (c == '`') {
            inCode = !inCode;
            out.push_back(' ');
            continue;
        }
        out.push_back(inCode ? ' ' : c);
    }
    return out;
}

std::optional<std::string_view> fenceMarker(std::string_view line) {
    size_t indent = 0;
    while (indent < line.size() && indent < 3 && line[indent] == ' ')
        ++indent;
    auto rest = line.substr(indent);
    if (rest.rfind("```", 0) == 0)
        return std::string_view("```");
    if (rest.rfind("~~~", 0) == 0)
        return std::string_view("~~~");
    return std::nullopt;
}

void collectFrontmatterTags(const nlohmann::json& frontmatter, std::vector<std::string>& tags) {
    auto addTag = [&tags](std::string_view raw) {
        auto t = common::trim(raw);
        while (!t.empty() && t.front() == '#')
            t.remove_prefix(1);
        if (!t.empty()) {
            appendUnique(tags, "#" + std::string(t));
        }
    };

    for (const char* field : {"tags", "tag"}) {
        auto it = frontmatter.find(field);
        if (it == frontmatter.end()) {
            continue;
        }
        if (it->is_string()) {
            const auto& s = it->get_ref<const std::string&>();
            size_t start = 0;
            while (start < s.size()) {
                const auto end = s.find_first_of(", \t", start);
                addTag(std::string_view(s).substr(
                    start, end == std::string::npos ? std::string::npos : end - start));
                if (end == std::string::npos)
                    break;
                start = end + 1;
            }
        } else if (it->is_array()) {
            for (const auto& item : *it) {
                if (item.is_string()) {
                    addTag(item.get_ref<const std::string&>());
                } else if (item.is_number()) {
                    addTag(item.dump());
                }
            }
        }
    }
}

} // namespace

FrontmatterSplit splitFrontmatter(std::string_view content) {
    FrontmatterSplit split;
    split.body = std::string(content);

    const auto lines = splitLines(content);
    if (lines.empty() || common::trim(lines.front().text) != "---") {
        return split;
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        if (!isFrontmatterClose(lines[i].text)) {
            continue;
        }
        const size_t yamlStart = lines.front().next;
        const size_t yamlEnd = lines[i - 1].next;
        split.yaml = std::string(content.substr(yamlStart, yamlEnd - yamlStart));
        split.body = std::string(content.substr(lines[i].next));
        return split;
    }
    return split;
}

Result<nlohmann::json> parseFrontmatterYaml(std::string_view yaml) {
    if (common::trim(yaml).empty()) {
        return nlohmann::json::object();
    }
    try {
        const YAML::Node root = YAML::Load(std::string(yaml));
        if (root.IsNull()) {
            return nlohmann::json::object();
        }
        if (!root.IsMap()) {
            return Error{ErrorCode::InvalidData, "Front matter is not a mapping"};
        }
        return yamlToJson(root);
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ParseError, std::string("Invalid front matter: ") + e.what()};
    }
}

std::string emitFrontmatterYaml(const nlohmann::json& frontmatter) {
    YAML::Emitter out;
    out.SetIndent(2);
    emitJson(out, frontmatter.is_object() ? frontmatter : nlohmann::json::object());
    return std::string(out.c_str());
}

std::string replaceFrontmatter(std::string_view content, const nlohmann::json& frontmatter) {
    const auto split = splitFrontmatter(content);
    if (!frontmatter.is_object() || frontmatter.empty()) {
        return split.body;
    }
    std::string out = "---\n";
    out += emitFrontmatterYaml(frontmatter);
    if (out.back() != '\n') {
        out.push_back('\n');
    }
    out += "---\n";
    out += split.body;
    return out;
}

ParsedNote parseNote(std::string_view content) {
    ParsedNote note;
    auto split = splitFrontmatter(content);

    if (split.yaml) {
        auto parsed = parseFrontmatterYaml(*split.yaml);
        if (parsed) {
            note.metadata.frontmatter = std::move(parsed).value();
        } else {
            note.frontmatterValid = false;
            spdlog::debug("Ignoring front matter: {}", parsed.error().message);
        }
    }

    std::optional<std::string_view> openFence;
    for (const auto& line : splitLines(split.body)) {
        if (auto marker = fenceMarker(line.text)) {
            if (!openFence) {
                openFence = marker;
            } else if (*openFence == *marker) {
                openFence.reset();
            }
            continue;
        }
        if (openFence) {
            continue;
        }

        if (auto heading = parseHeading(line.text)) {
            note.metadata.headings.push_back(std::move(*heading));
        }
        const auto visible = stripInlineCode(line.text);
        scanLinks(visible, note.metadata.links);
        scanInlineTags(visible, note.metadata.tags);
    }

    collectFrontmatterTags(note.metadata.frontmatter, note.metadata.tags);
    note.body = std::move(split.body);
    return note;
}

} // namespace loregraph::vault
