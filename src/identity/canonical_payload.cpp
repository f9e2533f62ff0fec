#include "tessera/identity/canonical_payload.hpp"
#include "tessera/protocol/constants.hpp"
#include "tessera/core/format.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>

namespace tessera::protocol::identity {

namespace {
    using google::protobuf::ListValue;
    using google::protobuf::Struct;
    using google::protobuf::Value;

    bool IsSignatureField(const std::string& key) {
        return key == kSignatureField || key == kSignaturesField;
    }

    void AppendQuoted(std::string& out, const std::string& text) {
        out.push_back('"');
        for (const char ch : text) {
            switch (ch) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(ch) < 0x20) {
                        out += compat::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    } else {
                        out.push_back(ch);
                    }
            }
        }
        out.push_back('"');
    }

    Result<Unit, ProtocolFailure> AppendValue(std::string& out, const Value& value, size_t depth);

    Result<Unit, ProtocolFailure> AppendStruct(std::string& out, const Struct& object, size_t depth) {
        if (depth > CanonicalPayload::MAX_DEPTH) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Payload nesting exceeds maximum depth"));
        }
        std::vector<const std::string*> keys;
        keys.reserve(object.fields().size());
        for (const auto& [key, _] : object.fields()) {
            if (!IsSignatureField(key)) {
                keys.push_back(&key);
            }
        }
        std::sort(keys.begin(), keys.end(),
                  [](const std::string* a, const std::string* b) { return *a < *b; });

        out.push_back('{');
        bool first = true;
        for (const std::string* key : keys) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            AppendQuoted(out, *key);
            out.push_back(':');
            TESSERA_TRY(AppendValue(out, object.fields().at(*key), depth + 1));
        }
        out.push_back('}');
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> AppendList(std::string& out, const ListValue& list, size_t depth) {
        if (depth > CanonicalPayload::MAX_DEPTH) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Payload nesting exceeds maximum depth"));
        }
        out.push_back('[');
        for (int i = 0; i < list.values_size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            TESSERA_TRY(AppendValue(out, list.values(i), depth + 1));
        }
        out.push_back(']');
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> AppendValue(std::string& out, const Value& value, size_t depth) {
        switch (value.kind_case()) {
            case Value::kNullValue:
                out += "null";
                break;
            case Value::kBoolValue:
                out += value.bool_value() ? "true" : "false";
                break;
            case Value::kNumberValue: {
                const double number = value.number_value();
                if (!std::isfinite(number)) {
                    return Result<Unit, ProtocolFailure>::Err(
                        ProtocolFailure::InvalidInput("Payload contains a non-finite number"));
                }
                out += compat::format("{}", number);
                break;
            }
            case Value::kStringValue:
                AppendQuoted(out, value.string_value());
                break;
            case Value::kStructValue:
                return AppendStruct(out, value.struct_value(), depth);
            case Value::kListValue:
                return AppendList(out, value.list_value(), depth);
            case Value::KIND_NOT_SET:
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Payload contains a value with no kind"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Result<google::protobuf::Struct, ProtocolFailure> CanonicalPayload::ParseJson(std::string_view json) {
    Struct payload;
    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(json), &payload);
    if (!status.ok()) {
        return Result<Struct, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Payload is not a JSON object: {}", status.ToString())));
    }
    return Result<Struct, ProtocolFailure>::Ok(std::move(payload));
}

Result<std::string, ProtocolFailure> CanonicalPayload::Canonicalize(const google::protobuf::Struct& payload) {
    std::string out;
    auto result = AppendStruct(out, payload, 0);
    if (result.IsErr()) {
        return Result<std::string, ProtocolFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::string, ProtocolFailure>::Ok(std::move(out));
}

Result<std::string, ProtocolFailure> CanonicalPayload::CanonicalizeJson(std::string_view json) {
    auto parsed = ParseJson(json);
    if (parsed.IsErr()) {
        return Result<std::string, ProtocolFailure>::Err(std::move(parsed).UnwrapErr());
    }
    return Canonicalize(parsed.Unwrap());
}

Result<std::vector<uint8_t>, ProtocolFailure> CanonicalPayload::ToBytes(const google::protobuf::Struct& payload) {
    return Canonicalize(payload).Map([](std::string text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    });
}

}
