#include "wxstream/json/fast_json.hpp"

namespace wxstream {

namespace {

[[nodiscard]] tl::unexpected<JsonParseError> failure(simdjson::error_code code) {
    return tl::unexpected(JsonParseError(std::string(simdjson::error_message(code))));
}

}  // namespace

JsonResult FastJsonParser::parse(std::string_view text) {
    const simdjson::padded_string padded(text);

    try {
        auto document = parser_.iterate(padded);
        if (document.error() != simdjson::SUCCESS) {
            return failure(document.error());
        }
        auto root = document.get_value();
        if (root.error() != simdjson::SUCCESS) {
            return failure(root.error());
        }
        return convert(root.value(), 0);
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

JsonResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            std::format("nesting deeper than {} levels", config_.max_depth)));
    }

    auto type = value.type();
    if (type.error() != simdjson::SUCCESS) {
        return failure(type.error());
    }

    switch (type.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = value.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return failure(obj.error());
            }
            return convert_object(obj.value(), depth + 1);
        }
        case simdjson::ondemand::json_type::array: {
            auto arr = value.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return failure(arr.error());
            }
            return convert_array(arr.value(), depth + 1);
        }
        case simdjson::ondemand::json_type::string: {
            auto str = value.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return failure(str.error());
            }
            return nlohmann::json(std::string(str.value()));
        }
        case simdjson::ondemand::json_type::number: {
            // Integers keep their exact value; anything else becomes a double
            auto as_int = value.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = value.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            auto as_double = value.get_double();
            if (as_double.error() != simdjson::SUCCESS) {
                return failure(as_double.error());
            }
            return nlohmann::json(as_double.value());
        }
        case simdjson::ondemand::json_type::boolean: {
            auto flag = value.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return failure(flag.error());
            }
            return nlohmann::json(flag.value());
        }
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
    }

    return tl::unexpected(JsonParseError("unrecognised JSON value"));
}

JsonResult FastJsonParser::convert_object(simdjson::ondemand::object obj, std::size_t depth) {
    nlohmann::json out = nlohmann::json::object();

    for (auto field : obj) {
        auto key = field.unescaped_key();
        if (key.error() != simdjson::SUCCESS) {
            return failure(key.error());
        }
        auto member = field.value();
        if (member.error() != simdjson::SUCCESS) {
            return failure(member.error());
        }
        auto converted = convert(member.value(), depth);
        if (converted.has_value() == false) {
            return converted;
        }
        out[std::string(key.value())] = std::move(*converted);
    }
    return out;
}

JsonResult FastJsonParser::convert_array(simdjson::ondemand::array arr, std::size_t depth) {
    nlohmann::json out = nlohmann::json::array();

    for (auto element : arr) {
        if (element.error() != simdjson::SUCCESS) {
            return failure(element.error());
        }
        auto converted = convert(element.value(), depth);
        if (converted.has_value() == false) {
            return converted;
        }
        out.push_back(std::move(*converted));
    }
    return out;
}

JsonResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

JsonResult fast_parse_object(std::string_view text) {
    auto parsed = fast_parse(text);
    if (parsed.has_value() && parsed->is_object() == false) {
        return tl::unexpected(JsonParseError("payload is not a JSON object"));
    }
    return parsed;
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace wxstream
