#pragma once

#include <cstdio>
#include <cstring>
#include <algorithm>

#include <etl/span.h>
#include <etl/string_view.h>
#include <etl/vector.h>
#include <etl/string.h>

#include "utils/utils.hpp"
#include "logging/logging.hpp"
#include "param.hpp"
#include "front.hpp"

/**
 * @brief Parameter group backed by the text file at Front::GetParamsPath()
 *
 * File format, one parameter per line:
 *
 *      # comment
 *      gateway.rangeBias: 76.8
 *
 * Lines of other groups are preserved on save.
 */
template<typename TParams>
class FileFrontend : public IFrontend {
public:
    static constexpr size_t kMaxLineLen = 256;
    static constexpr size_t kMaxFileLen = 8192;

    FileFrontend(const char* groupName) : m_GroupName(groupName) {
        Front::AddFrontend(this);
        LOG_DEBUG("FileFrontend '%s' created", groupName);
    }

    ~FileFrontend() override {
        Front::RemoveFrontend(this);
    }

    FileFrontend(const FileFrontend&) = delete;
    FileFrontend& operator=(const FileFrontend&) = delete;

    void Init() override {
        ErrorParam err = LoadParams();
        if (err != ErrorParam::OK && err != ErrorParam::FILE_NOT_FOUND) {
            LOG_WARN("Group %s loaded with errors: %s", m_GroupName.data(), ToString(err));
        }
    }

    // data is always an ASCII value, len excludes the nul character
    virtual ErrorParam SetParam(const char* name, const void* data, uint32_t len) override {
        for (const ParamDef& param : GetParamLayout()) {
            if (strcmp(param.name, name) == 0) {
                char* dst = reinterpret_cast<char*>(&m_Params) + param.address;
                if (param.type != ParamType::STRING) {
                    // Always have a buffer of at least 8 bytes for the transformation
                    char dataTransformed[sizeof(double)] = {};
                    if (param.len > sizeof(dataTransformed)) {
                        return ErrorParam::INVALID_DATA;
                    }
                    if (Utils::TransformStrToData(param.type, static_cast<const char*>(data), dataTransformed) != Utils::ErrorTransform::OK) {
                        return ErrorParam::INVALID_DATA;
                    }
                    memcpy(dst, dataTransformed, param.len);
                } else {
                    // Space for the nul character is required
                    if (len >= param.len) {
                        return ErrorParam::PARAM_TOO_LONG;
                    }
                    memcpy(dst, data, len);
                    dst[len] = '\0';
                }
                return ErrorParam::OK;
            }
        }
        return ErrorParam::NAME_NOT_FOUND;
    }

    // value must hold at least Utils::kMaxValueStrLen bytes and the longest string parameter
    virtual ErrorParam GetParam(const char* name, char* value, uint32_t& len, ParamType& type) override {
        for (const ParamDef& param : GetParamLayout()) {
            if (strcmp(param.name, name) == 0) {
                const char* src = reinterpret_cast<const char*>(&m_Params) + param.address;
                if (param.type != ParamType::STRING) {
                    if (Utils::TransformDataToStr(param.type, src, value) != Utils::ErrorTransform::OK) {
                        return ErrorParam::FAILED_TO_READ;
                    }
                    len = static_cast<uint32_t>(strlen(value));
                } else {
                    len = static_cast<uint32_t>(strnlen(src, param.len));
                    memcpy(value, src, len);
                }
                value[len] = '\0';
                type = param.type;
                if (!Utils::IsAscii(value, len)) {
                    memset(value, 0, len);
                    return ErrorParam::INVALID_DATA;
                }
                return ErrorParam::OK;
            }
        }
        return ErrorParam::NAME_NOT_FOUND;
    }

    virtual ErrorParam LoadParams() override {
        FILE* file = fopen(Front::GetParamsPath(), "r");
        if (file == nullptr) {
            LOG_INFO("No %s found, using defaults for group %s", Front::GetParamsPath(), m_GroupName.data());
            return ErrorParam::FILE_NOT_FOUND;
        }

        ErrorParam result = ErrorParam::OK;
        char line[kMaxLineLen];
        uint32_t lineNumber = 0;

        while (fgets(line, sizeof(line), file) != nullptr) {
            lineNumber++;
            etl::string_view trimmed = Utils::Trim(etl::string_view(line));

            // Skip empty lines and comments
            if (trimmed.empty() || trimmed.front() == '#') {
                continue;
            }

            etl::string_view group;
            etl::string_view name;
            etl::string_view value;
            if (!Utils::SplitParamAssignment(trimmed, ':', group, name, value)) {
                LOG_WARN("%s:%u: malformed line", Front::GetParamsPath(), lineNumber);
                continue;
            }

            // Check if this parameter belongs to our group
            if (group != m_GroupName) {
                continue;
            }

            etl::string<64> paramName(name.begin(), name.end());
            etl::string<kMaxLineLen> paramValue(value.begin(), value.end());
            ErrorParam err = SetParam(paramName.c_str(), paramValue.c_str(), static_cast<uint32_t>(paramValue.size()));
            if (err != ErrorParam::OK) {
                LOG_WARN("%s:%u: %s.%s rejected: %s", Front::GetParamsPath(), lineNumber,
                         m_GroupName.data(), paramName.c_str(), ToString(err));
                result = err;
            }
        }

        fclose(file);
        LOG_INFO("Loaded parameters for group %s from %s", m_GroupName.data(), Front::GetParamsPath());
        return result;
    }

    virtual ErrorParam SaveParams() override {
        etl::string<kMaxFileLen> fileContent;

        // Keep lines from other groups
        FILE* file = fopen(Front::GetParamsPath(), "r");
        if (file != nullptr) {
            char line[kMaxLineLen];
            while (fgets(line, sizeof(line), file) != nullptr) {
                etl::string_view trimmed = Utils::Trim(etl::string_view(line));
                etl::string_view group;
                etl::string_view name;
                etl::string_view value;
                if (Utils::SplitParamAssignment(trimmed, ':', group, name, value) && group == m_GroupName) {
                    continue;
                }
                if (fileContent.size() + strlen(line) >= fileContent.capacity()) {
                    fclose(file);
                    return ErrorParam::PARAM_TOO_LONG;
                }
                fileContent += line;
            }
            fclose(file);
        }

        // Add our group's parameters
        for (const ParamDef& param : GetParamLayout()) {
            char strValue[kMaxLineLen] = {};
            uint32_t len = 0;
            ParamType type;
            if (GetParam(param.name, strValue, len, type) != ErrorParam::OK) {
                return ErrorParam::FAILED_TO_READ;
            }

            etl::string<kMaxLineLen> paramLine;
            paramLine.assign(m_GroupName.begin(), m_GroupName.end());
            paramLine += ".";
            paramLine += param.name;
            paramLine += ": ";
            paramLine += strValue;
            paramLine += "\n";

            if (fileContent.size() + paramLine.size() >= fileContent.capacity()) {
                return ErrorParam::PARAM_TOO_LONG;
            }
            fileContent += paramLine;
        }

        file = fopen(Front::GetParamsPath(), "w");
        if (file == nullptr) {
            LOG_ERROR("Failed to open %s for writing", Front::GetParamsPath());
            return ErrorParam::FILE_SYSTEM_ERROR;
        }

        size_t written = fwrite(fileContent.data(), 1, fileContent.size(), file);
        if (fclose(file) != 0 || written != fileContent.size()) {
            LOG_ERROR("Failed to write %s", Front::GetParamsPath());
            return ErrorParam::FAILED_TO_WRITE;
        }

        LOG_INFO("Saved parameters for group %s", m_GroupName.data());
        return ErrorParam::OK;
    }

    virtual const etl::string_view GetParamGroup() const override {
        return m_GroupName;
    }

    const TParams& GetParams() const {
        return m_Params;
    }

protected:
    TParams m_Params;
    etl::string_view m_GroupName;
};
