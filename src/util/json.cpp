#include <pmat/json.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace pmat::json {

Result<Json::Value> parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        while (!errs.empty() && (errs.back() == '\n' || errs.back() == ' ')) errs.pop_back();
        return PmatError(PmatError::BadRequest, "invalid JSON: " + errs);
    }
    return Result<Json::Value>::ok(std::move(root));
}

std::string compact(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, v);
}

std::string pretty(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, v);
}

Result<std::string> get_string(const Json::Value& obj, const char* key,
                               const std::string& fallback) {
    if (!obj.isObject() || !obj.isMember(key) || obj[key].isNull()) {
        return Result<std::string>::ok(fallback);
    }
    const auto& v = obj[key];
    if (!v.isString()) return PmatError::validation(key, "expected a string");
    return Result<std::string>::ok(v.asString());
}

Result<int64_t> get_int(const Json::Value& obj, const char* key, int64_t fallback) {
    if (!obj.isObject() || !obj.isMember(key) || obj[key].isNull()) {
        return Result<int64_t>::ok(fallback);
    }
    const auto& v = obj[key];
    if (v.isIntegral()) return Result<int64_t>::ok(v.asInt64());
    if (v.isString()) {
        // CLI and HTTP query-style params arrive as strings
        try {
            size_t used = 0;
            int64_t n = std::stoll(v.asString(), &used);
            if (used == v.asString().size()) return Result<int64_t>::ok(n);
        } catch (const std::exception&) {
        }
    }
    return PmatError::validation(key, "expected an integer");
}

Result<bool> get_bool(const Json::Value& obj, const char* key, bool fallback) {
    if (!obj.isObject() || !obj.isMember(key) || obj[key].isNull()) {
        return Result<bool>::ok(fallback);
    }
    const auto& v = obj[key];
    if (v.isBool()) return Result<bool>::ok(v.asBool());
    if (v.isString()) {
        auto s = v.asString();
        if (s == "true" || s == "1" || s == "yes") return Result<bool>::ok(true);
        if (s == "false" || s == "0" || s == "no") return Result<bool>::ok(false);
    }
    return PmatError::validation(key, "expected a boolean");
}

Result<std::vector<std::string>> get_string_list(const Json::Value& obj, const char* key) {
    std::vector<std::string> out;
    if (!obj.isObject() || !obj.isMember(key) || obj[key].isNull()) {
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    const auto& v = obj[key];
    if (v.isString()) {
        // Accept "a,b,c" for list-valued CLI flags
        std::stringstream ss(v.asString());
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) out.push_back(item);
        }
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    if (!v.isArray()) return PmatError::validation(key, "expected an array of strings");
    for (const auto& item : v) {
        if (!item.isString()) return PmatError::validation(key, "expected an array of strings");
        out.push_back(item.asString());
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<std::string> require_string(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key) || obj[key].isNull()) {
        return PmatError::validation(key, "required parameter is missing");
    }
    return get_string(obj, key);
}

Result<std::vector<std::pair<std::string, std::string>>> string_pairs(const Json::Value& obj) {
    std::vector<std::pair<std::string, std::string>> out;
    if (obj.isNull()) return Result<decltype(out)>::ok(std::move(out));
    if (!obj.isObject()) return PmatError::validation("parameters", "expected an object");

    for (const auto& name : obj.getMemberNames()) {
        const auto& v = obj[name];
        if (v.isString()) {
            out.emplace_back(name, v.asString());
        } else if (v.isBool()) {
            out.emplace_back(name, v.asBool() ? "true" : "false");
        } else if (v.isIntegral()) {
            out.emplace_back(name, std::to_string(v.asInt64()));
        } else if (v.isDouble()) {
            out.emplace_back(name, compact(v));
        } else if (!v.isNull()) {
            return PmatError::validation(name, "parameter values must be scalars");
        }
    }
    return Result<decltype(out)>::ok(std::move(out));
}

Json::Value string_array(const std::vector<std::string>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& s : items) arr.append(s);
    return arr;
}

} // namespace pmat::json
