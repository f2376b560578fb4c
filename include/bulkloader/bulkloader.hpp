#ifndef BULKLOADER_BULKLOADER_HPP
#define BULKLOADER_BULKLOADER_HPP

// Project version
#define BULKLOADER_VERSION_MAJOR 0
#define BULKLOADER_VERSION_MINOR 1
#define BULKLOADER_VERSION_PATCH 0

#include <bulkloader/export.hpp>
#include <bulkloader/context.hpp>
#include <bulkloader/enums.hpp>
#include <bulkloader/errors.hpp>
#include <bulkloader/download_request.hpp>
#include <bulkloader/download_task.hpp>
#include <bulkloader/downloader.hpp>
#include <bulkloader/result.hpp>
#include <bulkloader/stream_writer.hpp>
#include <bulkloader/transport.hpp>
#include <bulkloader/curl_transport.hpp>
#include <bulkloader/url.hpp>
#include <bulkloader/utils.hpp>

#endif
