#ifndef BULKLOADER_FILEIO_HPP
#define BULKLOADER_FILEIO_HPP

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <share.h>
#include <windows.h>
#endif

namespace bulkloader
{
    namespace fs = std::filesystem;

    // Minimal RAII wrapper around a C stream, errors are reported through `std::error_code`.
    class FileIO
    {
    private:
        FILE* m_fs = nullptr;
        fs::path m_path;

    public:
#ifdef _WIN32
        constexpr static wchar_t write_binary[] = L"wb";
        // fails when the file already exists
        constexpr static wchar_t write_binary_exclusive[] = L"wbx";
#else
        constexpr static char write_binary[] = "wb";
        // fails when the file already exists
        constexpr static char write_binary_exclusive[] = "wbx";
#endif

        FileIO() = default;

#ifdef _WIN32
        inline explicit FileIO(const fs::path& file_path,
                               const wchar_t* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::_wfsopen(file_path.wstring().c_str(), mode, _SH_DENYNO);
            if (!m_fs)
            {
                ec.assign(GetLastError(), std::generic_category());
                spdlog::error("Could not open file: {}", ec.message());
            }
        }
#else
        inline explicit FileIO(const fs::path& file_path,
                               const char* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::fopen(file_path.c_str(), mode);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
                spdlog::error("Could not open file: {}", ec.message());
            }
        }
#endif

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Error: {}", ec.message());
                }
            }
        }

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        inline std::streamoff tell() const
        {
            return ::ftell(m_fs);
        }

        inline std::size_t write(const void* buffer,
                                 std::size_t element_size,
                                 std::size_t element_count) const noexcept
        {
            return ::fwrite(buffer, element_size, element_count, m_fs);
        }

        inline void flush(std::error_code& ec) noexcept
        {
            ec.clear();
            if (::fflush(m_fs) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
        }

        inline const fs::path& path() const
        {
            return m_path;
        }

        void close(std::error_code& ec) noexcept
        {
            if (!m_fs)
            {
                ec.clear();
                return;
            }
            if (::fclose(m_fs) == 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
            // the stream is released even when fclose fails
            m_fs = nullptr;
        }

        inline int error() const noexcept
        {
            return ::ferror(m_fs);
        }
    };
}

#endif
