#ifndef BULKLOADER_STREAM_WRITER_HPP
#define BULKLOADER_STREAM_WRITER_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>

#include <tl/expected.hpp>

#include <bulkloader/export.hpp>
#include <bulkloader/errors.hpp>
#include <bulkloader/fileio.hpp>

namespace bulkloader
{
    namespace fs = std::filesystem;

    /** Writes a byte stream to a destination file.
     * Bytes go to a part file of its own, `<destination>.<random token>.blpart`, created
     * exclusively and renamed to the destination on `commit()`. Any failure (and destruction before `commit()`) removes the part file so
     * a failed transfer never leaves a truncated file behind.
     */
    class BULKLOADER_API StreamWriter
    {
    public:
        explicit StreamWriter(fs::path destination);
        virtual ~StreamWriter();

        StreamWriter(const StreamWriter&) = delete;
        StreamWriter& operator=(const StreamWriter&) = delete;
        StreamWriter(StreamWriter&&) = delete;
        StreamWriter& operator=(StreamWriter&&) = delete;

        // Creates the missing parent directories and opens the part file.
        tl::expected<void, DownloaderError> open();

        tl::expected<void, DownloaderError> write(const char* buffer, std::size_t size);

        // Flushes, closes and moves the part file to the destination.
        tl::expected<std::uintmax_t, DownloaderError> commit();

        // Drops whatever was written so far.
        void discard();

        // Drains `body` into `destination` chunk by chunk.
        static tl::expected<std::uintmax_t, DownloaderError> write_stream(std::istream& body,
                                                                          const fs::path& destination);

        const fs::path& destination() const noexcept
        {
            return m_destination;
        }

        const fs::path& part_file() const noexcept
        {
            return m_part_file;
        }

        std::uintmax_t bytes_written() const noexcept
        {
            return m_bytes_written;
        }

    protected:
        // Writes one chunk to the open part file, returns the number of bytes written.
        virtual std::size_t write_chunk(const char* buffer, std::size_t size);

    private:
        tl::expected<void, DownloaderError> fail(const std::string& reason);

        fs::path m_destination;
        fs::path m_part_file;
        std::unique_ptr<FileIO> m_outfile;
        std::uintmax_t m_bytes_written = 0;
        // the part file exists and belongs to this writer
        bool m_created = false;
        bool m_committed = false;
    };
}

#endif
