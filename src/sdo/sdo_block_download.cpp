/* ======================================================================
 * Block download (client -> server)
 *
 *  Client                                   Server
 *  ------                                   ------
 *  0xC0|cc|s idx sub size    ──────────▶    0xA0|sc idx sub blksize
 *  c|seq data[7] (seq 1..)   ──────────▶    seq must be last + 1
 *  ...                                      seq == blksize or c set:
 *                                             0xA2 ackseq blksize
 *  0xC1|n<<2 crc             ──────────▶    strip n pad bytes, check crc,
 *                                           write, 0xA1
 *
 *  No gaps are tolerated: an unexpected sequence number aborts.
 * ====================================================================== */

#include <algorithm>

#include "sdo/sdo_server.hpp"
#include "util/log.hpp"

namespace sdo
{

std::uint32_t SdoServer::block_download(const FrameBytes &req)
{
    // bit 0 tells initiate (0) from end (1)
    if ((req[0] & 0x01) == 0)
        return init_block_download(req);
    return end_block_download(req);
}

std::uint32_t SdoServer::init_block_download(const FrameBytes &req)
{
    const std::uint8_t command = req[0];
    session_.reset();
    session_.index    = get_u16(&req[1]);
    session_.subindex = req[3];

    if (command & BLOCK_SIZE_SPECIFIED)
        session_.declared_size = get_u32(&req[4]);

    session_.sequence    = 0;
    session_.block_size  = MAX_BLOCK_SIZE;
    session_.crc_enabled = (command & CRC_SUPPORTED) != 0;
    session_.crc.reset();
    session_.mode  = Mode::BlockDownload;
    session_.phase = BlockPhase::Receiving;
    LOG_INFO("Initiating block download for 0x%04X:%02X (size %s%u, crc %s)", session_.index,
             session_.subindex, session_.declared_size ? "" : "unknown/",
             session_.declared_size.value_or(0), session_.crc_enabled ? "on" : "off");

    std::uint8_t res_command = RESPONSE_BLOCK_DOWNLOAD | INITIATE_BLOCK_TRANSFER;
    if (session_.crc_enabled)
        res_command |= CRC_SUPPORTED;

    FrameBytes res{};
    pack_header(res, res_command, session_.index, session_.subindex);
    res[4] = session_.block_size;
    send_response(res);
    return ABORT_NONE;
}

std::uint32_t SdoServer::block_download_segment(const FrameBytes &req)
{
    const std::uint8_t command  = req[0];
    const std::uint8_t sequence = command & SEQUENCE_MASK;
    const bool         is_last  = (command & NO_MORE_BLOCKS) != 0;

    if (sequence != session_.sequence + 1)
    {
        LOG_WARN("block download 0x%04X:%02X: expected segment %u, got %u", session_.index,
                 session_.subindex, (unsigned)session_.sequence + 1, (unsigned)sequence);
        return ABORT_INVALID_SEQUENCE_NUMBER;
    }
    // all declared bytes are already here, so any further segment is too much
    if (session_.declared_size && !session_.buffer.empty() &&
        session_.buffer.size() >= *session_.declared_size)
    {
        LOG_WARN("0x%04X:%02X: more data than the declared %u bytes", session_.index,
                 session_.subindex, *session_.declared_size);
        return ABORT_PARAMETER_LENGTH_HIGH;
    }

    session_.sequence = sequence;
    // padding of the last segment is stripped at end
    session_.buffer.insert(session_.buffer.end(), req.begin() + 1, req.end());
    if (session_.crc_enabled)
        session_.crc.update(&req[1], SEGMENT_PAYLOAD);

    if (session_.sequence >= session_.block_size || is_last)
    {
        FrameBytes res{};
        res[0] = static_cast<std::uint8_t>(RESPONSE_BLOCK_DOWNLOAD | BLOCK_TRANSFER_RESPONSE);
        res[1] = session_.sequence;
        res[2] = session_.block_size;
        send_response(res);

        session_.sequence = 0;
        if (is_last)
            session_.phase = BlockPhase::AwaitingEnd;
    }
    return ABORT_NONE;
}

std::uint32_t SdoServer::end_block_download(const FrameBytes &req)
{
    if (session_.mode != Mode::BlockDownload || session_.phase != BlockPhase::AwaitingEnd)
    {
        LOG_WARN("end of block download without a completed transfer (mode %s)",
                 mode_name(session_.mode));
        return ABORT_INVALID_COMMAND_SPECIFIER;
    }

    const std::size_t pad = std::min<std::size_t>((req[0] >> 2) & 0x07, session_.buffer.size());
    session_.buffer.resize(session_.buffer.size() - pad);

    if (session_.declared_size)
    {
        if (session_.buffer.size() > *session_.declared_size)
            return ABORT_PARAMETER_LENGTH_HIGH;
        if (session_.buffer.size() < *session_.declared_size)
            LOG_WARN("0x%04X:%02X: got %zu of %u declared bytes", session_.index,
                     session_.subindex, session_.buffer.size(), *session_.declared_size);
    }

    if (session_.crc_enabled)
    {
        // the running crc included the padding, so it is recomputed over the trimmed data
        const std::uint16_t received   = get_u16(&req[1]);
        const std::uint16_t calculated = crc::crc16(session_.buffer.data(), session_.buffer.size());
        LOG_DEBUG("block download crc: received 0x%04X, calculated 0x%04X (running 0x%04X)",
                  received, calculated, session_.crc.finalize());
        if (received != calculated)
            return ABORT_CRC_ERROR;
    }

    const od::Status st = store_.write(session_.index, session_.subindex, session_.buffer, true);
    if (st != od::Status::Ok)
    {
        LOG_WARN("write 0x%04X:%02X (%zu bytes) failed: %s", session_.index, session_.subindex,
                 session_.buffer.size(), od::status_name(st));
        return ABORT_STORE_APPLICATION;
    }

    FrameBytes res{};
    res[0] = static_cast<std::uint8_t>(RESPONSE_BLOCK_DOWNLOAD | END_BLOCK_TRANSFER);
    send_response(res);

    LOG_INFO("Block download of 0x%04X:%02X complete (%zu bytes)", session_.index,
             session_.subindex, session_.buffer.size());
    session_.reset();
    return ABORT_NONE;
}

}  // namespace sdo
