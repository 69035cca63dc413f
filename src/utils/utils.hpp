#pragma once

#define ULS_PACKED __attribute__((__packed__))

#include <cstddef>
#include <cstdint>

#include <etl/string_view.h>

#include "param.hpp"

namespace Utils {

    enum class ErrorTransform {
        OK = 0,
        INVALID_TYPE,
        INVALID_DATA,
        CONVERSION_ERROR,
    };

    // Transform an ASCII value into the binary representation of the given ParamType.
    // outputData must hold at least the size of the parameter.
    ErrorTransform TransformStrToData(const ParamType type, const char* inputData, void* outputData);

    // outputData must hold at least kMaxValueStrLen bytes
    ErrorTransform TransformDataToStr(const ParamType type, const void* inputData, char* outputData);

    static constexpr size_t kMaxValueStrLen = 32;

    bool IsAscii(const char* str, size_t len);

    /**
     * @brief Split "group.name=value" (or "group.name: value") into its parts
     *
     * Surrounding whitespace of each part is removed.
     *
     * @return false if the separators are missing or group/name are empty. The value may be empty.
     */
    bool SplitParamAssignment(etl::string_view assignment, char separator,
                              etl::string_view& group, etl::string_view& name, etl::string_view& value);

    etl::string_view Trim(etl::string_view str);

};
