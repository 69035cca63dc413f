#include "utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace Utils {

template <typename T, typename TParsed>
static ErrorTransform StoreChecked(TParsed val, void* outputData) {
    if (val < static_cast<TParsed>(std::numeric_limits<T>::min()) ||
        val > static_cast<TParsed>(std::numeric_limits<T>::max())) {
        return ErrorTransform::CONVERSION_ERROR;
    }
    T narrowed = static_cast<T>(val);
    memcpy(outputData, &narrowed, sizeof(T));
    return ErrorTransform::OK;
}

// Utility function to transform data based on the specified ParamType
ErrorTransform TransformStrToData(const ParamType type, const char* inputData, void* outputData) {
    char* endPtr = nullptr; // Pointer to the next character after the numerical value

    if (inputData == nullptr || *inputData == '\0') {
        return ErrorTransform::INVALID_DATA;
    }

    errno = 0;
    switch (type) {
        case ParamType::UINT32:
        case ParamType::UINT16:
        case ParamType::UINT8: {
            if (*inputData == '-') {
                return ErrorTransform::CONVERSION_ERROR;
            }
            unsigned long long val = std::strtoull(inputData, &endPtr, 10);
            if (*endPtr != '\0' || errno == ERANGE) {
                return ErrorTransform::CONVERSION_ERROR;
            }
            if (type == ParamType::UINT32) return StoreChecked<uint32_t>(val, outputData);
            if (type == ParamType::UINT16) return StoreChecked<uint16_t>(val, outputData);
            return StoreChecked<uint8_t>(val, outputData);
        }
        case ParamType::INT32:
        case ParamType::INT16:
        case ParamType::INT8: {
            long long val = std::strtoll(inputData, &endPtr, 10);
            if (*endPtr != '\0' || errno == ERANGE) {
                return ErrorTransform::CONVERSION_ERROR;
            }
            if (type == ParamType::INT32) return StoreChecked<int32_t>(val, outputData);
            if (type == ParamType::INT16) return StoreChecked<int16_t>(val, outputData);
            return StoreChecked<int8_t>(val, outputData);
        }
        case ParamType::FLOAT: {
            float val = std::strtof(inputData, &endPtr);
            if (*endPtr != '\0' || errno == ERANGE) {
                return ErrorTransform::CONVERSION_ERROR;
            }
            memcpy(outputData, &val, sizeof(val));
            break;
        }
        case ParamType::DOUBLE: {
            double val = std::strtod(inputData, &endPtr);
            if (*endPtr != '\0' || errno == ERANGE) {
                return ErrorTransform::CONVERSION_ERROR;
            }
            memcpy(outputData, &val, sizeof(val));
            break;
        }
        case ParamType::BOOL: {
            bool val;
            if (strcmp(inputData, "true") == 0 || strcmp(inputData, "1") == 0) {
                val = true;
            } else if (strcmp(inputData, "false") == 0 || strcmp(inputData, "0") == 0) {
                val = false;
            } else {
                return ErrorTransform::INVALID_DATA;
            }
            memcpy(outputData, &val, sizeof(val));
            break;
        }
        default:
            return ErrorTransform::INVALID_TYPE;
    }
    return ErrorTransform::OK;
}

ErrorTransform TransformDataToStr(const ParamType type, const void *inputData, char* outputData)
{
    int written = 0;

    switch (type) {
        case ParamType::UINT32: {
            uint32_t val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%u", static_cast<unsigned>(val));
            break;
        }
        case ParamType::UINT16: {
            uint16_t val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%u", static_cast<unsigned>(val));
            break;
        }
        case ParamType::UINT8: {
            uint8_t val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%u", static_cast<unsigned>(val));
            break;
        }
        case ParamType::INT32: {
            int32_t val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%d", static_cast<int>(val));
            break;
        }
        case ParamType::INT16: {
            int16_t val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%d", static_cast<int>(val));
            break;
        }
        case ParamType::INT8: {
            int8_t val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%d", static_cast<int>(val));
            break;
        }
        case ParamType::FLOAT: {
            float val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%g", static_cast<double>(val));
            break;
        }
        case ParamType::DOUBLE: {
            double val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%.10g", val);
            break;
        }
        case ParamType::BOOL: {
            bool val;
            memcpy(&val, inputData, sizeof(val));
            written = snprintf(outputData, kMaxValueStrLen, "%s", val ? "true" : "false");
            break;
        }
        default:
            return ErrorTransform::INVALID_TYPE;
    }

    if (written < 0 || static_cast<size_t>(written) >= kMaxValueStrLen) {
        return ErrorTransform::CONVERSION_ERROR;
    }
    return ErrorTransform::OK;
}

/**
 * @brief Check if a string is ASCII
 *
 * @param str
 * @return true
 * @return false
 */
bool IsAscii(const char* str, size_t len) {
    for (size_t i = 0; i < len; i++) {
        if (static_cast<unsigned char>(str[i]) > 127) {
            return false; // Non-ASCII character found
        }
    }
    return true; // All characters are ASCII
}

etl::string_view Trim(etl::string_view str)
{
    const char* whitespace = " \t\r\n";
    size_t first = str.find_first_not_of(whitespace);
    if (first == etl::string_view::npos) {
        return etl::string_view();
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

bool SplitParamAssignment(etl::string_view assignment, char separator,
                          etl::string_view& group, etl::string_view& name, etl::string_view& value)
{
    size_t sepIndex = assignment.find(separator);
    if (sepIndex == etl::string_view::npos) {
        return false;
    }

    etl::string_view key = Trim(assignment.substr(0, sepIndex));
    value = Trim(assignment.substr(sepIndex + 1));

    size_t dotIndex = key.find('.');
    if (dotIndex == etl::string_view::npos) {
        return false;
    }

    group = Trim(key.substr(0, dotIndex));
    name = Trim(key.substr(dotIndex + 1));

    return !group.empty() && !name.empty();
}

}
