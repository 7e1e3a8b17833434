// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/file.hpp>

#include <system_error>

#include <cerrno>

namespace mcm {

result<buffered_file> open_buffered_file(const std::filesystem::path& path,
                                         const buffered_file_mode mode) noexcept
{
    const auto* m = mode == buffered_file_mode::read ? "rb" : "wb";

    if (auto* fp = std::fopen(path.c_str(), m); fp)
        return buffered_file(fp);

    return new_error(io_errc::open_error,
                     e_errno{ errno },
                     e_file_name{ path.string() });
}

result<std::string> read_file_to_buffer(const std::filesystem::path& path)
{
    mcm_auto(fp, open_buffered_file(path, buffered_file_mode::read));

    std::string buffer;
    char        chunk[4096];

    for (;;) {
        const auto read = std::fread(chunk, 1, sizeof chunk, fp.get());
        buffer.append(chunk, read);

        if (read < sizeof chunk) {
            if (std::ferror(fp.get()))
                return new_error(io_errc::read_error,
                                 e_file_name{ path.string() });
            break;
        }
    }

    return buffer;
}

std::filesystem::path temporary_path(const std::filesystem::path& path)
{
    auto ret = path;
    ret += ".tmp";
    return ret;
}

status commit_temporary(buffered_file&& fp, const std::filesystem::path& path)
{
    const auto tmp = temporary_path(path);

    const bool flushed = std::fflush(fp.get()) == 0 and not std::ferror(fp.get());
    const bool closed  = std::fclose(fp.release()) == 0;

    std::error_code ec;

    if (not(flushed and closed)) {
        std::filesystem::remove(tmp, ec);
        return new_error(io_errc::write_error, e_file_name{ tmp.string() });
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        const auto error = ec.value();
        std::filesystem::remove(tmp, ec);
        return new_error(io_errc::rename_error,
                         e_errno{ error },
                         e_file_name{ path.string() });
    }

    return success();
}

} // namespace mcm
