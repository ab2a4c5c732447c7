#include "action_decoder.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace sandlyst {

namespace {

const std::string kFence = "```";
const std::string kPythonFence = "```python";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// Content between open_fence and the next ``` after it, or npos if not closed
bool find_block(const std::string& text, const std::string& open_fence, std::string& block) {
    size_t open = text.find(open_fence);
    if (open == std::string::npos) {
        return false;
    }
    size_t content_start = open + open_fence.size();
    size_t close = text.find(kFence, content_start);
    if (close == std::string::npos) {
        return false;
    }
    block = text.substr(content_start, close - content_start);
    return true;
}

MalformedAction malformed(const std::string& raw_text, const std::string& reason) {
    MalformedAction action;
    action.raw_text = raw_text;
    action.reason = reason;
    return action;
}

// Optional string field: absent or null is "", other non-strings are errors
bool optional_string(const json& object, const std::string& key, std::string& out) {
    out.clear();
    if (!object.contains(key) || object[key].is_null()) {
        return true;
    }
    if (!object[key].is_string()) {
        return false;
    }
    out = object[key].get<std::string>();
    return true;
}

} // anonymous namespace

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string action_name(const PlannerAction& action) {
    if (std::holds_alternative<ComputeAction>(action)) return "compute";
    if (std::holds_alternative<FinalAction>(action)) return "final";
    return "malformed";
}

std::string strip_code_fences(const std::string& text) {
    std::string cleaned = trim(text);
    if (!starts_with(cleaned, kFence)) {
        return cleaned;
    }

    std::vector<std::string> lines = split_lines(cleaned);
    if (!lines.empty() && starts_with(lines.front(), kFence)) {
        lines.erase(lines.begin());
    }
    while (!lines.empty() && starts_with(trim(lines.back()), kFence)) {
        lines.pop_back();
    }

    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += "\n";
        }
        joined += lines[i];
    }
    return trim(joined);
}

std::string normalize_code_newlines(const std::string& code) {
    auto newline_count = static_cast<size_t>(std::count(code.begin(), code.end(), '\n'));
    if (newline_count > 1 || code.find("\\n") == std::string::npos) {
        return code;
    }

    std::string candidate;
    candidate.reserve(code.size());
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] == '\\' && i + 1 < code.size() && code[i + 1] == 'n') {
            candidate += '\n';
            ++i;
        } else {
            candidate += code[i];
        }
    }

    auto candidate_count = static_cast<size_t>(std::count(candidate.begin(), candidate.end(), '\n'));
    return candidate_count > newline_count ? candidate : code;
}

std::string extract_code(const std::string& text) {
    std::string block;
    if (find_block(text, kPythonFence, block) || find_block(text, kFence, block)) {
        return normalize_code_newlines(trim(block));
    }
    // No closed block: the field is the script itself, possibly with a dangling fence
    return normalize_code_newlines(strip_code_fences(text));
}

PlannerAction decode_action(const std::string& raw_text) {
    std::string cleaned = strip_code_fences(raw_text);

    json payload;
    try {
        payload = json::parse(cleaned);
    } catch (const json::parse_error& e) {
        return malformed(raw_text, std::string("invalid JSON: ") + e.what());
    }

    if (!payload.is_object()) {
        return malformed(raw_text, "reply is not a JSON object");
    }
    if (!payload.contains("action") || !payload["action"].is_string()) {
        return malformed(raw_text, "missing action");
    }

    std::string action = to_lower(trim(payload["action"].get<std::string>()));

    if (action == "compute") {
        std::string code_field;
        if (!optional_string(payload, "code", code_field)) {
            return malformed(raw_text, "code is not a string");
        }
        ComputeAction compute;
        compute.code = extract_code(code_field);
        if (compute.code.empty()) {
            return malformed(raw_text, "compute action has no code");
        }
        if (!optional_string(payload, "reason", compute.reason)) {
            compute.reason.clear();
        }
        return compute;
    }

    if (action == "final") {
        FinalAction final_action;

        std::string chart_field;
        if (!optional_string(payload, "chart_code", chart_field)) {
            return malformed(raw_text, "chart_code is not a string");
        }
        final_action.chart_code = extract_code(chart_field);

        if (!optional_string(payload, "summary_md", final_action.summary)) {
            return malformed(raw_text, "summary_md is not a string");
        }

        if (payload.contains("figures") && !payload["figures"].is_null()) {
            const json& figures = payload["figures"];
            if (!figures.is_array()) {
                return malformed(raw_text, "figures is not an array");
            }
            for (const auto& figure : figures) {
                FigureSpec spec;
                if (figure.is_object()) {
                    if (figure.contains("title") && figure["title"].is_string()) {
                        spec.title = figure["title"].get<std::string>();
                    }
                    if (figure.contains("description_md") && figure["description_md"].is_string()) {
                        spec.description = figure["description_md"].get<std::string>();
                    }
                }
                final_action.figures.push_back(spec);
            }
        }
        return final_action;
    }

    return malformed(raw_text, "unknown action '" + action + "'");
}

} // namespace sandlyst
