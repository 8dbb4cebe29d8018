//
//  flacforge_errors.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <stdexcept>
#include <string>

namespace flacforge {

/// Failure classes surfaced through `Status::error`.
enum class ErrorKind {
    None = 0,
    Format,    ///< marker mismatch, unexpected first block, malformed block framing
    IO,        ///< open/read/write failure
    NotFound,  ///< requested item (lyrics, cover) is not present
    Decode,    ///< vorbis-comment or picture payload present but malformed
    Picture,   ///< cover-art construction failed (never leaves the facade)
};

const char *error_kind_name(ErrorKind kind);

/**
 * @brief Base of all errors thrown by the block layer.
 *
 * The public API in flacforge.hpp never lets these escape; they are converted to a `Status`.
 */
class FlacError : public std::runtime_error {
   public:
    FlacError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

   private:
    ErrorKind kind_;
};

class FormatError : public FlacError {
   public:
    explicit FormatError(const std::string &message) : FlacError(ErrorKind::Format, message) {}
};

class IoError : public FlacError {
   public:
    explicit IoError(const std::string &message) : FlacError(ErrorKind::IO, message) {}
};

class NotFoundError : public FlacError {
   public:
    explicit NotFoundError(const std::string &message)
        : FlacError(ErrorKind::NotFound, message) {}
};

class DecodeError : public FlacError {
   public:
    explicit DecodeError(const std::string &message) : FlacError(ErrorKind::Decode, message) {}
};

class PictureError : public FlacError {
   public:
    explicit PictureError(const std::string &message)
        : FlacError(ErrorKind::Picture, message) {}
};

}  // namespace flacforge
