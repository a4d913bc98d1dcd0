#include "graph/properties.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <limits>

namespace kgraph {

namespace {

Json::Value normalizeValue(const Json::Value& value, const std::string& path) {
    switch (value.type()) {
        case Json::realValue:
            if (!std::isfinite(value.asDouble())) {
                throw ValidationError(path, "non-finite number is not serializable");
            }
            return value;
        case Json::uintValue:
            if (value.asUInt64() <= static_cast<Json::UInt64>(std::numeric_limits<Json::Int64>::max())) {
                return Json::Value(static_cast<Json::Int64>(value.asUInt64()));
            }
            return value;
        case Json::arrayValue: {
            Json::Value out(Json::arrayValue);
            for (Json::ArrayIndex i = 0; i < value.size(); i++) {
                out.append(normalizeValue(value[i], path + "[" + std::to_string(i) + "]"));
            }
            return out;
        }
        case Json::objectValue: {
            Json::Value out(Json::objectValue);
            for (const auto& key : value.getMemberNames()) {
                out[key] = normalizeValue(value[key], path + "." + key);
            }
            return out;
        }
        default:
            return value;
    }
}

Json::StreamWriterBuilder compactWriter() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return builder;
}

} // namespace

Properties checkedProperties(const Json::Value& props, const std::string& subject) {
    if (props.isNull()) {
        return Json::Value(Json::objectValue);
    }
    if (!props.isObject()) {
        throw ValidationError(subject + ".properties", "expected a JSON object");
    }
    return normalizeValue(props, subject + ".properties");
}

void mergeProperties(Properties& target, const Properties& patch) {
    if (!target.isObject()) {
        target = Json::Value(Json::objectValue);
    }
    for (const auto& key : patch.getMemberNames()) {
        if (patch[key].isNull()) {
            target.removeMember(key);
        } else {
            target[key] = patch[key];
        }
    }
}

std::string stringifyProperties(const Properties& props) {
    static const Json::StreamWriterBuilder writer = compactWriter();
    return Json::writeString(writer, props);
}

std::string stringifyValue(const Json::Value& value) {
    if (value.isString()) return value.asString();
    return stringifyProperties(value);
}

} // namespace kgraph
