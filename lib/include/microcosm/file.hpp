// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_FILE_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_FILE_HPP

#include <microcosm/error.hpp>

#include <filesystem>
#include <memory>
#include <string>

#include <cstdio>

namespace mcm {

enum class buffered_file_mode : u8 {
    read,  //!< Open a file for reading, read from start.
    write, //!< Create a file for writing, destroy contents.
};

namespace details {

/** A wrapper to reduce the size of the buffered_file pointer. */
struct buffered_file_deleter {
    void operator()(std::FILE* fd) noexcept { std::fclose(fd); }
};

} // namespace details

using buffered_file =
  std::unique_ptr<std::FILE, details::buffered_file_deleter>;

/** Return a @c std::FILE pointer wrapped into a @c std::unique_ptr. This
 * function neither returns a nullptr. Files are opened in binary mode. */
result<buffered_file> open_buffered_file(const std::filesystem::path& path,
                                         const buffered_file_mode mode) noexcept;

//! Read the whole content of the file @a path.
result<std::string> read_file_to_buffer(const std::filesystem::path& path);

//! @return the temporary file used by @c write_atomically for @a path.
std::filesystem::path temporary_path(const std::filesystem::path& path);

//! Flush and close @a fp then rename the temporary file of @a path to @a
//! path. On error the temporary file is removed.
status commit_temporary(buffered_file&& fp, const std::filesystem::path& path);

/**
 * Write @a path with the write-then-rename protocol: the function @a fn
 * writes into a temporary file next to @a path (a @c std::FILE* argument
 * and returns a @c status), the temporary file replaces @a path only if
 * @a fn succeeds. The previous content of @a path is never truncated.
 */
template<typename Function>
status write_atomically(const std::filesystem::path& path, Function&& fn)
{
    const auto tmp = temporary_path(path);

    mcm_auto(fp, open_buffered_file(tmp, buffered_file_mode::write));

    if (auto ret = fn(fp.get()); not ret) {
        fp.reset();
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return ret;
    }

    return commit_temporary(std::move(fp), path);
}

} // namespace mcm

#endif
