/* ======================================================================
 * Expedited and segmented transfer
 *
 *  Upload (server -> client)
 *    0x40 initiate   ──▶  <= 4 bytes: 0x43|n<<2, data in [4..7]   (done)
 *                         >  4 bytes: 0x41, size in [4..7]
 *    0x60|t segment  ──▶  0x00|t|n<<1|c, up to 7 bytes in [1..7]
 *
 *  Download (client -> server)
 *    0x2x initiate   ──▶  0x60            (expedited: written at once)
 *    0x0x|t segment  ──▶  0x20|t          (c set: buffer written)
 *
 *  t alternates 0,1,0,... starting at 0 after every initiate.
 * ====================================================================== */

#include <algorithm>

#include "sdo/sdo_server.hpp"
#include "util/log.hpp"

namespace sdo
{

std::uint32_t SdoServer::init_upload(const FrameBytes &req)
{
    // a new initiate supersedes whatever was open
    session_.reset();
    session_.index    = get_u16(&req[1]);
    session_.subindex = req[3];

    std::vector<std::uint8_t> data;
    if (const std::uint32_t code = read_checked(data))
        return code;

    const std::size_t size = data.size();
    if (size == 0)
    {
        LOG_INFO("No content to upload for 0x%04X:%02X", session_.index, session_.subindex);
        return ABORT_NO_DATA_AVAILABLE;
    }

    FrameBytes   res{};
    std::uint8_t res_command = RESPONSE_UPLOAD | SIZE_SPECIFIED;
    if (size <= EXPEDITED_MAX)
    {
        LOG_INFO("Expedited upload for 0x%04X:%02X", session_.index, session_.subindex);
        res_command |= EXPEDITED;
        res_command |= static_cast<std::uint8_t>((EXPEDITED_MAX - size) << 2);
        std::copy(data.begin(), data.end(), res.begin() + 4);
    }
    else
    {
        LOG_INFO("Initiating segmented upload for 0x%04X:%02X (%zu bytes)", session_.index,
                 session_.subindex, size);
        put_u32(&res[4], static_cast<std::uint32_t>(size));
        session_.buffer = std::move(data);
        session_.cursor = 0;
        session_.toggle = 0;
        session_.mode   = Mode::SegmentedUpload;
    }

    pack_header(res, res_command, session_.index, session_.subindex);
    send_response(res);
    return ABORT_NONE;
}

std::uint32_t SdoServer::segmented_upload(std::uint8_t command)
{
    if (session_.mode != Mode::SegmentedUpload)
    {
        LOG_ERROR("No buffer initialized for segmented upload");
        return ABORT_GENERAL_ERROR;
    }
    const std::uint8_t toggle = (command & TOGGLE_BIT) ? 1 : 0;
    if (toggle != session_.toggle)
        return ABORT_TOGGLE_NOT_ALTERNATED;

    const std::size_t n = std::min(SEGMENT_PAYLOAD, session_.remaining());
    FrameBytes        res{};
    auto              first = session_.buffer.begin() + static_cast<std::ptrdiff_t>(session_.cursor);
    std::copy(first, first + static_cast<std::ptrdiff_t>(n), res.begin() + 1);
    session_.cursor += n;

    std::uint8_t res_command = RESPONSE_SEGMENT_UPLOAD;
    if (session_.toggle)
        res_command |= TOGGLE_BIT;
    res_command |= static_cast<std::uint8_t>((SEGMENT_PAYLOAD - n) << 1);
    const bool done = session_.remaining() == 0;
    if (done)
        res_command |= NO_MORE_DATA;
    res[0] = res_command;

    session_.toggle ^= 1;
    send_response(res);

    if (done)
    {
        LOG_INFO("Segmented upload of 0x%04X:%02X complete (%zu bytes)", session_.index,
                 session_.subindex, session_.buffer.size());
        session_.reset();
    }
    return ABORT_NONE;
}

std::uint32_t SdoServer::init_download(const FrameBytes &req)
{
    const std::uint8_t command = req[0];
    session_.reset();
    session_.index    = get_u16(&req[1]);
    session_.subindex = req[3];

    if (command & EXPEDITED)
    {
        LOG_INFO("Expedited download for 0x%04X:%02X", session_.index, session_.subindex);
        std::size_t size = EXPEDITED_MAX;
        if (command & SIZE_SPECIFIED)
            size = EXPEDITED_MAX - ((command >> 2) & 0x3);
        const std::vector<std::uint8_t> data(req.begin() + 4,
                                             req.begin() + 4 + static_cast<std::ptrdiff_t>(size));
        if (const std::uint32_t code = write_checked(data))
            return code;
    }
    else
    {
        LOG_INFO("Initiating segmented download for 0x%04X:%02X", session_.index,
                 session_.subindex);
        if (command & SIZE_SPECIFIED)
        {
            session_.declared_size = get_u32(&req[4]);
            LOG_INFO("Size is %u bytes", *session_.declared_size);
        }
        session_.toggle = 0;
        session_.mode   = Mode::SegmentedDownload;
    }

    FrameBytes res{};
    pack_header(res, RESPONSE_DOWNLOAD, session_.index, session_.subindex);
    send_response(res);
    return ABORT_NONE;
}

std::uint32_t SdoServer::segmented_download(const FrameBytes &req)
{
    const std::uint8_t command = req[0];
    if (session_.mode != Mode::SegmentedDownload)
    {
        LOG_ERROR("No buffer initialized for segmented download");
        return ABORT_GENERAL_ERROR;
    }
    const std::uint8_t toggle = (command & TOGGLE_BIT) ? 1 : 0;
    if (toggle != session_.toggle)
        return ABORT_TOGGLE_NOT_ALTERNATED;

    const std::size_t n = SEGMENT_PAYLOAD - ((command >> 1) & 0x7);
    if (session_.declared_size && session_.buffer.size() + n > *session_.declared_size)
    {
        LOG_WARN("0x%04X:%02X: more data than the declared %u bytes", session_.index,
                 session_.subindex, *session_.declared_size);
        return ABORT_PARAMETER_LENGTH_HIGH;
    }
    session_.buffer.insert(session_.buffer.end(), req.begin() + 1,
                           req.begin() + 1 + static_cast<std::ptrdiff_t>(n));

    const bool done = (command & NO_MORE_DATA) != 0;
    if (done)
    {
        if (session_.declared_size && session_.buffer.size() < *session_.declared_size)
            LOG_WARN("0x%04X:%02X: got %zu of %u declared bytes", session_.index,
                     session_.subindex, session_.buffer.size(), *session_.declared_size);
        if (const std::uint32_t code = write_checked(session_.buffer))
            return code;
    }

    FrameBytes res{};
    res[0] = static_cast<std::uint8_t>(RESPONSE_SEGMENT_DOWNLOAD | (session_.toggle ? TOGGLE_BIT : 0));
    session_.toggle ^= 1;
    send_response(res);

    if (done)
    {
        LOG_INFO("Segmented download of 0x%04X:%02X complete (%zu bytes)", session_.index,
                 session_.subindex, session_.buffer.size());
        session_.reset();
    }
    return ABORT_NONE;
}

}  // namespace sdo
