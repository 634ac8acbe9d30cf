/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef ASSAY_CONFIG_CORE_EXCEPTION_HPP
#define ASSAY_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace assay::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)      \
    throw assay::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                     \
    throw assay::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                           ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace assay::config

#endif  // ASSAY_CONFIG_CORE_EXCEPTION_HPP
