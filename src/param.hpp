#pragma once

#include <cstddef>
#include <cstdint>

#include <etl/array.h>
#include <etl/type_lookup.h>

// Wire type of a parameter field, values are ASCII in files and on the command line
enum class ParamType {
    UINT8 = 0,
    UINT16,
    UINT32,
    INT8,
    INT16,
    INT32,
    FLOAT,
    DOUBLE,
    STRING,     // etl::array<char, N>, nul terminated
    BOOL,       // "true"/"false"/"1"/"0"
    UNDEFINED
};

enum class ErrorParam {
    OK = 0,
    NAME_NOT_FOUND,
    GROUP_NOT_FOUND,
    FAILED_TO_WRITE,
    FAILED_TO_READ,
    PARAM_TOO_LONG,     // String does not leave room for the terminator
    INVALID_DATA,       // Value does not parse or does not fit the field
    FILE_SYSTEM_ERROR,
    FILE_NOT_FOUND      // Not an error on load, defaults stay in place
};

const char* ToString(ErrorParam error);

// One field of a packed parameter struct
struct ParamDef {
    uint16_t address;
    uint16_t len;
    ParamType type;
    const char* name;
};

namespace param_detail {

    template <typename T, ParamType type>
    using Pair = etl::type_id_pair<T, static_cast<size_t>(type)>;

    // Any char array is a string, whatever its size
    template <size_t size>
    using Lookup = etl::type_id_lookup<
                        Pair<uint8_t, ParamType::UINT8>,
                        Pair<uint16_t, ParamType::UINT16>,
                        Pair<uint32_t, ParamType::UINT32>,
                        Pair<int8_t, ParamType::INT8>,
                        Pair<int16_t, ParamType::INT16>,
                        Pair<int32_t, ParamType::INT32>,
                        Pair<float, ParamType::FLOAT>,
                        Pair<double, ParamType::DOUBLE>,
                        Pair<etl::array<char, size>, ParamType::STRING>,
                        Pair<bool, ParamType::BOOL>>;

}

/**
 * @brief Describe structure::attrib at compile time
 *
 * A field of an unsupported type fails to compile.
 */
#define PARAM_DEF(structure, attrib) ParamDef{ \
    offsetof(structure, attrib), \
    sizeof(structure::attrib), \
    static_cast<ParamType>(param_detail::Lookup<sizeof(structure::attrib)>::id_from_type_v<decltype(structure::attrib)>), \
    #attrib}
