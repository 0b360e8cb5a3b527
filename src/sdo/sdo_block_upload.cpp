/* ======================================================================
 * Block upload (server -> client)
 *
 *  Client                                   Server
 *  ------                                   ------
 *  0xA0|cc  idx sub blksize  ──────────▶    read entry, 0xC6|sc idx sub size
 *  0xA3 start                ──────────▶    seg 1..blksize (last: 0x80|seq)
 *  0xA2 ackseq blksize       ──────────▶    ackseq < sent: resend ackseq+1..sent
 *                                           else: next window, or
 *                                           0xC1|n<<2 crc (end)
 *  0xA1 end                  ──────────▶    (nothing, transfer already closed)
 *
 *  Sequence numbers restart at 1 every window. Segments of the current
 *  window stay in pending[] until the client acks all of them.
 * ====================================================================== */

#include <algorithm>

#include "sdo/sdo_server.hpp"
#include "util/log.hpp"

namespace sdo
{

namespace
{
std::uint8_t clamp_block_size(unsigned v)
{
    return static_cast<std::uint8_t>(std::min<unsigned>(std::max<unsigned>(v, 1), MAX_BLOCK_SIZE));
}
}  // namespace

std::uint32_t SdoServer::block_upload(const FrameBytes &req, std::size_t len)
{
    switch (req[0] & SUBCOMMAND_MASK)
    {
        case INITIATE_BLOCK_TRANSFER:
            return init_block_upload(req, len);
        case START_BLOCK_UPLOAD:
            return start_block_upload();
        case BLOCK_TRANSFER_RESPONSE:
            return block_upload_ack(req, len);
        case END_BLOCK_TRANSFER:
            if (session_.mode == Mode::BlockUpload)
            {
                end_block_upload();
                return ABORT_NONE;
            }
            LOG_DEBUG("Client confirmed end of block upload for 0x%04X:%02X", session_.index,
                      session_.subindex);
            return ABORT_NONE;
    }
    return ABORT_INVALID_COMMAND_SPECIFIER;
}

std::uint32_t SdoServer::init_block_upload(const FrameBytes &req, std::size_t len)
{
    const std::uint8_t command = req[0];
    session_.reset();
    session_.index    = get_u16(&req[1]);
    session_.subindex = req[3];

    const bool     crc_requested = (command & CRC_SUPPORTED) != 0;
    const unsigned requested     = len > 4 ? req[4] : MAX_BLOCK_SIZE;

    std::vector<std::uint8_t> data;
    if (const std::uint32_t code = read_checked(data))
        return code;
    const std::size_t size = data.size();
    if (size == 0)
    {
        LOG_INFO("No content to upload for 0x%04X:%02X", session_.index, session_.subindex);
        return ABORT_NO_DATA_AVAILABLE;
    }

    session_.buffer        = std::move(data);
    session_.cursor        = 0;
    session_.declared_size = static_cast<std::uint32_t>(size);
    session_.block_size    = clamp_block_size(requested);
    session_.sequence      = 0;
    session_.pending_count = 0;
    session_.crc_enabled   = crc_requested;
    session_.crc.reset();
    session_.mode  = Mode::BlockUpload;
    session_.phase = BlockPhase::Initiated;
    LOG_INFO("Initiating block upload for 0x%04X:%02X (%zu bytes, blksize %u, crc %s)",
             session_.index, session_.subindex, size, (unsigned)session_.block_size,
             crc_requested ? "on" : "off");

    std::uint8_t res_command = RESPONSE_BLOCK_UPLOAD | INITIATE_BLOCK_TRANSFER | BLOCK_SIZE_SPECIFIED;
    if (session_.crc_enabled)
        res_command |= CRC_SUPPORTED;

    FrameBytes res{};
    pack_header(res, res_command, session_.index, session_.subindex);
    put_u32(&res[4], static_cast<std::uint32_t>(size));
    send_response(res);
    return ABORT_NONE;
}

std::uint32_t SdoServer::start_block_upload()
{
    if (session_.mode != Mode::BlockUpload || session_.phase != BlockPhase::Initiated)
    {
        LOG_WARN("start of block upload without a pending initiate (mode %s)",
                 mode_name(session_.mode));
        return ABORT_INVALID_COMMAND_SPECIFIER;
    }
    send_block_upload_window();
    return ABORT_NONE;
}

// ======================================================================
// Function: SdoServer::send_block_upload_window
// - In: block upload active, sequence == 0, data left in buffer
// - Out: up to block_size segments sent, each kept in pending[seq - 1]
// - Note: NO_MORE_BLOCKS marks the last segment of the whole transfer,
//         not of the window
// ======================================================================
void SdoServer::send_block_upload_window()
{
    std::size_t sent = 0;
    while (sent < session_.block_size && session_.remaining() > 0)
    {
        const std::size_t n     = std::min(SEGMENT_PAYLOAD, session_.remaining());
        const auto        first = session_.buffer.begin() + static_cast<std::ptrdiff_t>(session_.cursor);

        session_.sequence++;
        sent++;

        FrameBytes seg{};
        seg[0] = session_.sequence;
        std::copy(first, first + static_cast<std::ptrdiff_t>(n), seg.begin() + 1);
        if (session_.crc_enabled)
            session_.crc.update(&*first, n);
        session_.cursor += n;

        if (session_.remaining() == 0)
        {
            seg[0] |= NO_MORE_BLOCKS;
            session_.last_segment_len = n;
        }

        session_.pending[session_.sequence - 1] = seg;
        session_.pending_count                  = session_.sequence;
        send_response(seg);
    }
    session_.phase = BlockPhase::AwaitingAck;
    LOG_DEBUG("block upload 0x%04X:%02X: window of %zu segments sent, %zu bytes left",
              session_.index, session_.subindex, sent, session_.remaining());
}

std::uint32_t SdoServer::block_upload_ack(const FrameBytes &req, std::size_t len)
{
    if (session_.mode != Mode::BlockUpload || session_.phase != BlockPhase::AwaitingAck)
    {
        LOG_WARN("block upload ack without an outstanding window (mode %s)",
                 mode_name(session_.mode));
        return ABORT_INVALID_COMMAND_SPECIFIER;
    }

    const std::uint8_t ackseq  = len > 1 ? req[1] : 0;
    const unsigned     blksize = len > 2 ? req[2] : session_.block_size;
    session_.block_size        = clamp_block_size(blksize);

    if (ackseq > session_.sequence)
    {
        LOG_WARN("client acked segment %u, only %u were sent", (unsigned)ackseq,
                 (unsigned)session_.sequence);
        return ABORT_INVALID_SEQUENCE_NUMBER;
    }

    if (ackseq < session_.sequence)
    {
        LOG_WARN("block upload 0x%04X:%02X: client has %u of %u segments, resending the rest",
                 session_.index, session_.subindex, (unsigned)ackseq, (unsigned)session_.sequence);
        for (unsigned seq = ackseq + 1u; seq <= session_.sequence; seq++)
            send_response(session_.pending[seq - 1]);
        return ABORT_NONE;
    }

    // whole window received
    session_.pending_count = 0;
    session_.sequence      = 0;
    if (session_.remaining() > 0)
        send_block_upload_window();
    else
        end_block_upload();
    return ABORT_NONE;
}

void SdoServer::end_block_upload()
{
    const std::size_t unused =
        session_.last_segment_len > 0 ? SEGMENT_PAYLOAD - session_.last_segment_len : 0;

    FrameBytes res{};
    res[0] = static_cast<std::uint8_t>(RESPONSE_BLOCK_UPLOAD | END_BLOCK_TRANSFER |
                                       ((unused & 0x7) << 2));
    if (session_.crc_enabled)
        put_u16(&res[1], session_.crc.finalize());
    send_response(res);

    LOG_INFO("Block upload of 0x%04X:%02X complete (%zu bytes)", session_.index,
             session_.subindex, session_.cursor);
    session_.reset();
}

}  // namespace sdo
