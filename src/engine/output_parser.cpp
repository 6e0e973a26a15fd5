// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/output_parser.h>

#include <sortie/engine/executor_capability.h>

#include <boost/regex.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace sortie::engine {

namespace {

std::string trimCopy(std::string_view in) {
    auto begin = in.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
        return {};
    auto end = in.find_last_not_of(" \t\r\n");
    return std::string(in.substr(begin, end - begin + 1));
}

std::vector<std::string> splitLines(std::string_view output) {
    std::vector<std::string> lines;
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        auto t = trimCopy(line);
        if (!t.empty())
            lines.push_back(std::move(t));
    }
    return lines;
}

// Values that look like a placeholder are dropped so a rendered command never grows new ones.
void pushUnique(std::vector<ParsedFact>& out, ParsedFact fact) {
    if (containsPlaceholder(fact.value)) {
        spdlog::debug("[OutputParser] dropping '{}' value with placeholder syntax", fact.key);
        return;
    }
    if (std::find(out.begin(), out.end(), fact) == out.end())
        out.push_back(std::move(fact));
}

std::vector<ParsedFact> parseLines(const ParserRule& rule, std::string_view output) {
    std::vector<ParsedFact> out;
    for (auto& line : splitLines(output))
        pushUnique(out, ParsedFact{rule.key, std::move(line)});
    return out;
}

Result<boost::regex> compileRegex(const std::string& pattern) {
    try {
        return boost::regex(pattern, boost::regex::ECMAScript);
    } catch (const boost::regex_error& e) {
        return Error{ErrorCode::InvalidData, "Invalid regex '" + pattern + "': " + e.what()};
    }
}

// Boost.Regex matches without recursion, so output length is bounded by memory rather than
// stack depth. Pathological backtracking raises std::runtime_error instead of hanging.
Result<std::vector<ParsedFact>> parseRegex(const ParserRule& rule, std::string_view output) {
    auto re = compileRegex(rule.pattern);
    if (!re)
        return re.error();

    std::vector<ParsedFact> out;
    try {
        boost::cregex_iterator it(output.data(), output.data() + output.size(), re.value());
        for (; it != boost::cregex_iterator(); ++it) {
            const auto& m = *it;
            std::string value = m.size() > 1 && m[1].matched ? m[1].str() : m[0].str();
            value = trimCopy(value);
            if (!value.empty())
                pushUnique(out, ParsedFact{rule.key, std::move(value)});
        }
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::InvalidData,
                     "Regex '" + rule.pattern + "' gave up on output: " + e.what()};
    }
    return out;
}

std::vector<ParsedFact> parseKeyValue(const ParserRule& rule, std::string_view output) {
    std::vector<ParsedFact> out;
    for (const auto& line : splitLines(output)) {
        auto sep = line.find('=');
        if (sep == std::string::npos)
            sep = line.find(':');
        if (sep == std::string::npos || sep == 0)
            continue;
        auto key = trimCopy(std::string_view(line).substr(0, sep));
        auto value = trimCopy(std::string_view(line).substr(sep + 1));
        if (key.empty() || value.empty())
            continue;
        if (!rule.key.empty() && key != rule.key)
            continue;
        pushUnique(out, ParsedFact{std::move(key), std::move(value)});
    }
    return out;
}

std::string scalarToString(const nlohmann::json& node) {
    if (node.is_string())
        return node.get<std::string>();
    return node.dump();
}

Result<std::vector<ParsedFact>> parseJson(const ParserRule& rule, std::string_view output) {
    auto doc = nlohmann::json::parse(output.begin(), output.end(), nullptr, false);
    if (doc.is_discarded()) {
        spdlog::debug("[OutputParser] output is not JSON; json rule for '{}' yields nothing",
                      rule.key);
        return std::vector<ParsedFact>{};
    }

    const nlohmann::json* node = &doc;
    std::istringstream segments(rule.path);
    std::string segment;
    while (std::getline(segments, segment, '.')) {
        if (segment.empty())
            continue;
        if (node->is_object()) {
            auto it = node->find(segment);
            if (it == node->end())
                return std::vector<ParsedFact>{};
            node = &*it;
        } else if (node->is_array()) {
            std::size_t idx = 0;
            try {
                idx = static_cast<std::size_t>(std::stoul(segment));
            } catch (const std::exception&) {
                return std::vector<ParsedFact>{};
            }
            if (idx >= node->size())
                return std::vector<ParsedFact>{};
            node = &(*node)[idx];
        } else {
            return std::vector<ParsedFact>{};
        }
    }

    std::vector<ParsedFact> out;
    if (node->is_array()) {
        for (const auto& el : *node) {
            if (!el.is_null())
                pushUnique(out, ParsedFact{rule.key, scalarToString(el)});
        }
    } else if (!node->is_null()) {
        pushUnique(out, ParsedFact{rule.key, scalarToString(*node)});
    }
    return out;
}

} // namespace

Result<void> validateParserRule(const ParserRule& rule) {
    if (rule.kind != ParserKind::KeyValue && rule.key.empty()) {
        return Error{ErrorCode::InvalidData,
                     std::string("Parser of type '") + parserKindName(rule.kind) +
                         "' requires a fact key"};
    }
    switch (rule.kind) {
        case ParserKind::Regex:
            if (rule.pattern.empty())
                return Error{ErrorCode::InvalidData, "Regex parser requires a pattern"};
            if (auto re = compileRegex(rule.pattern); !re)
                return re.error();
            break;
        case ParserKind::Json:
            if (rule.path.empty())
                return Error{ErrorCode::InvalidData, "Json parser requires a path"};
            break;
        case ParserKind::Line:
        case ParserKind::KeyValue:
            break;
    }
    return {};
}

Result<std::vector<ParsedFact>> applyParser(const ParserRule& rule, std::string_view output) {
    switch (rule.kind) {
        case ParserKind::Line:
            return parseLines(rule, output);
        case ParserKind::Regex:
            return parseRegex(rule, output);
        case ParserKind::KeyValue:
            return parseKeyValue(rule, output);
        case ParserKind::Json:
            return parseJson(rule, output);
    }
    return Error{ErrorCode::NotSupported, "Unknown parser kind"};
}

Result<std::vector<ParsedFact>> applyParsers(const std::vector<ParserRule>& rules,
                                             std::string_view output) {
    std::vector<ParsedFact> out;
    for (const auto& rule : rules) {
        auto r = applyParser(rule, output);
        if (!r)
            return r.error();
        for (auto& f : std::move(r).value())
            pushUnique(out, std::move(f));
    }
    return out;
}

} // namespace sortie::engine
