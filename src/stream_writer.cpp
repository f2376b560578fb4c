#include <array>
#include <random>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <bulkloader/enums.hpp>
#include <bulkloader/stream_writer.hpp>

namespace bulkloader
{
    namespace
    {
        // `<destination>.<token>.blpart`, distinct for every writer of a destination
        fs::path make_part_file(const fs::path& destination)
        {
            static thread_local std::mt19937 generator{ std::random_device{}() };
            std::uniform_int_distribution<std::uint32_t> dist;
            return fs::path(
                fmt::format("{}.{:08x}{}", destination.string(), dist(generator), BULKLOADER_PARTEXT));
        }
    }

    StreamWriter::StreamWriter(fs::path destination)
        : m_destination(std::move(destination))
        , m_part_file(make_part_file(m_destination))
    {
    }

    StreamWriter::~StreamWriter()
    {
        if (!m_committed)
        {
            discard();
        }
    }

    tl::expected<void, DownloaderError> StreamWriter::open()
    {
        std::error_code ec;
        const fs::path parent = m_destination.parent_path();
        if (!parent.empty())
        {
            fs::create_directories(parent, ec);
            if (ec)
            {
                return fail(fmt::format(
                    "Could not create directory {}: {}", parent.string(), ec.message()));
            }
        }

        if (m_outfile)
        {
            discard();
        }

        spdlog::debug("Opening file {}", m_part_file.string());
        m_outfile = std::make_unique<FileIO>(m_part_file, FileIO::write_binary_exclusive, ec);
        if (ec)
        {
            // nothing was created, an existing file of that name is not ours to remove
            m_outfile.reset();
            return tl::unexpected(DownloaderError{
                ErrorCode::kWRITE,
                fmt::format("Could not open {}: {}", m_part_file.string(), ec.message()) });
        }
        m_created = true;
        m_bytes_written = 0;
        return {};
    }

    std::size_t StreamWriter::write_chunk(const char* buffer, std::size_t size)
    {
        return m_outfile->write(buffer, 1, size);
    }

    tl::expected<void, DownloaderError> StreamWriter::write(const char* buffer, std::size_t size)
    {
        if (!m_outfile || !m_outfile->open())
        {
            return fail(fmt::format("Writing {}: file is not open", m_part_file.string()));
        }

        const std::size_t written = write_chunk(buffer, size);
        m_bytes_written += written;
        if (written != size)
        {
            return fail(fmt::format("Writing file {} failed after {} bytes",
                                    m_part_file.string(),
                                    m_bytes_written));
        }
        return {};
    }

    tl::expected<std::uintmax_t, DownloaderError> StreamWriter::commit()
    {
        if (!m_outfile)
        {
            return tl::unexpected(
                fail(fmt::format("Nothing to commit for {}", m_destination.string())).error());
        }

        std::error_code ec;
        m_outfile->flush(ec);
        if (!ec)
        {
            m_outfile->close(ec);
        }
        if (ec)
        {
            return tl::unexpected(
                fail(fmt::format("Could not close {}: {}", m_part_file.string(), ec.message()))
                    .error());
        }
        m_outfile.reset();

        fs::rename(m_part_file, m_destination, ec);
        if (ec)
        {
            return tl::unexpected(fail(fmt::format("Could not move {} to {}: {}",
                                                   m_part_file.string(),
                                                   m_destination.string(),
                                                   ec.message()))
                                      .error());
        }

        m_created = false;
        m_committed = true;
        return m_bytes_written;
    }

    void StreamWriter::discard()
    {
        if (m_outfile)
        {
            std::error_code ec;
            m_outfile->close(ec);
            m_outfile.reset();
        }

        if (!m_created)
            return;
        m_created = false;

        std::error_code ec;
        if (fs::remove(m_part_file, ec))
        {
            spdlog::info("Removed partial file {}", m_part_file.string());
        }
        else if (ec)
        {
            spdlog::error("Could not remove {}: {}", m_part_file.string(), ec.message());
        }
    }

    tl::expected<void, DownloaderError> StreamWriter::fail(const std::string& reason)
    {
        discard();
        return tl::unexpected(DownloaderError{ ErrorCode::kWRITE, reason });
    }

    tl::expected<std::uintmax_t, DownloaderError> StreamWriter::write_stream(
        std::istream& body, const fs::path& destination)
    {
        StreamWriter writer(destination);
        if (auto res = writer.open(); !res)
        {
            return tl::unexpected(res.error());
        }

        constexpr std::size_t bufsize = 32768;
        std::array<char, bufsize> buffer;
        while (body)
        {
            body.read(buffer.data(), bufsize);
            const auto count = static_cast<std::size_t>(body.gcount());
            if (count == 0)
                break;
            if (auto res = writer.write(buffer.data(), count); !res)
            {
                return tl::unexpected(res.error());
            }
        }

        if (body.bad())
        {
            return tl::unexpected(
                writer.fail(fmt::format("Reading the body of {} failed", destination.string()))
                    .error());
        }
        return writer.commit();
    }
}
