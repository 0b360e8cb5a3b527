#include <algorithm>
#include <exception>

#include "sdo/sdo_server.hpp"
#include "util/log.hpp"

namespace sdo
{

const char *mode_name(Mode m)
{
    switch (m)
    {
        case Mode::Idle:
            return "idle";
        case Mode::SegmentedUpload:
            return "segmented-upload";
        case Mode::SegmentedDownload:
            return "segmented-download";
        case Mode::BlockUpload:
            return "block-upload";
        case Mode::BlockDownload:
            return "block-download";
    }
    return "?";
}

void Session::reset()
{
    mode    = Mode::Idle;
    toggle  = 0;
    buffer.clear();
    buffer.shrink_to_fit();
    cursor = 0;
    declared_size.reset();

    phase       = BlockPhase::None;
    block_size  = MAX_BLOCK_SIZE;
    sequence    = 0;
    crc_enabled = false;
    crc.reset();
    pending_count    = 0;
    last_segment_len = 0;
}

std::uint32_t abort_code_for(od::Status s)
{
    switch (s)
    {
        case od::Status::Ok:
            return ABORT_NONE;
        case od::Status::NoSuchObject:
            return ABORT_NOT_IN_OD;
        case od::Status::NoSuchSubindex:
            return ABORT_NO_SUCH_SUBINDEX;
        case od::Status::NotReadable:
            return ABORT_WRITE_ONLY;
        case od::Status::NotWritable:
            return ABORT_READ_ONLY;
        case od::Status::LengthMismatch:
            return ABORT_PARAMETER_LENGTH;
        case od::Status::LengthTooHigh:
            return ABORT_PARAMETER_LENGTH_HIGH;
        case od::Status::ValueRejected:
            return ABORT_VALUE_RANGE;
        case od::Status::NoValue:
            return ABORT_RESOURCE_NOT_AVAILABLE;
    }
    return ABORT_GENERAL_ERROR;
}

SdoServer::SdoServer(transport::ITransport &tx, od::ObjectStore &store, std::uint32_t tx_cobid)
    : tx_(tx), store_(store), tx_cobid_(tx_cobid)
{
}

void SdoServer::handle_incoming_frame(const transport::Frame &f, std::uint64_t timestamp_us)
{
    FrameBytes        req{};
    const std::size_t len = std::min<std::size_t>(f.len, FRAME_SIZE);
    std::copy_n(f.data.begin(), len, req.begin());
    LOG_DEBUG("rx id=0x%03X t=%llu mode=%s: %s", (unsigned)f.id, (unsigned long long)timestamp_us,
              mode_name(session_.mode), sdosrv::hex_bytes(req.data(), len).c_str());

    std::uint32_t code = ABORT_NONE;
    if (len == 0)
    {
        code = ABORT_INVALID_COMMAND_SPECIFIER;
    }
    else
    {
        try
        {
            code = dispatch(req, len);
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("unexpected failure in %s transfer of 0x%04X:%02X: %s",
                      mode_name(session_.mode), session_.index, session_.subindex, e.what());
            code = ABORT_GENERAL_ERROR;
        }
        catch (...)
        {
            LOG_ERROR("unexpected non-standard exception in %s transfer of 0x%04X:%02X",
                      mode_name(session_.mode), session_.index, session_.subindex);
            code = ABORT_GENERAL_ERROR;
        }
    }

    if (code != ABORT_NONE)
    {
        LOG_WARN("Aborting 0x%04X:%02X (%s): 0x%08X %s", session_.index, session_.subindex,
                 mode_name(session_.mode), code, abort_name(code));
        session_.reset();
        abort(code);
    }
}

// ======================================================================
// Function: SdoServer::dispatch
// - In: one request frame, its DLC
// - Out: abort code for the frame (ABORT_NONE when handled)
// - Note: mode first, command family second. While a block download is
//         receiving, byte 0 is c|seqno and its top bits can take any
//         family value; only the bare abort byte 0x80 (seqno 0, never a
//         valid segment) is the client's abort.
// ======================================================================
std::uint32_t SdoServer::dispatch(const FrameBytes &req, std::size_t len)
{
    const std::uint8_t command = req[0];

    switch (session_.mode)
    {
        case Mode::BlockDownload:
            if (session_.phase == BlockPhase::Receiving)
            {
                if (command == REQUEST_ABORTED)
                {
                    on_peer_abort(req);
                    return ABORT_NONE;
                }
                return block_download_segment(req);
            }
            break;
        case Mode::Idle:
        case Mode::SegmentedUpload:
        case Mode::SegmentedDownload:
        case Mode::BlockUpload:
            break;
    }

    switch (classify(command))
    {
        case Command::InitiateUpload:
            return init_upload(req);
        case Command::SegmentUpload:
            return segmented_upload(command);
        case Command::InitiateDownload:
            return init_download(req);
        case Command::SegmentDownload:
            return segmented_download(req);
        case Command::BlockUpload:
            return block_upload(req, len);
        case Command::BlockDownload:
            return block_download(req);
        case Command::Abort:
            on_peer_abort(req);
            return ABORT_NONE;
        case Command::Unknown:
            LOG_WARN("unknown command specifier 0x%02X", command);
            return ABORT_INVALID_COMMAND_SPECIFIER;
    }
    return ABORT_INVALID_COMMAND_SPECIFIER;
}

void SdoServer::abort(std::uint32_t code)
{
    send_response(make_abort(session_.index, session_.subindex, code));
}

void SdoServer::request_abort(std::uint32_t code)
{
    LOG_INFO("Local abort of 0x%04X:%02X (%s): 0x%08X %s", session_.index, session_.subindex,
             mode_name(session_.mode), code, abort_name(code));
    abort(code);
    session_.reset();
}

void SdoServer::on_peer_abort(const FrameBytes &req)
{
    const std::uint16_t index    = get_u16(&req[1]);
    const std::uint8_t  subindex = req[3];
    last_received_error_         = get_u32(&req[4]);
    LOG_INFO("Received request aborted for 0x%04X:%02X with code 0x%08X (%s)", index, subindex,
             last_received_error_, abort_name(last_received_error_));
}

void SdoServer::send_response(const FrameBytes &res)
{
    transport::Frame f;
    f.id  = tx_cobid_;
    f.len = static_cast<std::uint8_t>(FRAME_SIZE);
    std::copy(res.begin(), res.end(), f.data.begin());
    LOG_DEBUG("Sending response: %s", sdosrv::hex_bytes(res.data(), res.size()).c_str());
    if (!tx_.send(f))
        LOG_WARN("transport '%s' did not take frame id=0x%03X", tx_.name().c_str(),
                 (unsigned)tx_cobid_);
}

std::uint32_t SdoServer::read_checked(std::vector<std::uint8_t> &out)
{
    const od::Status st = store_.read(session_.index, session_.subindex, out, true);
    if (st != od::Status::Ok)
        LOG_INFO("read 0x%04X:%02X refused: %s", session_.index, session_.subindex,
                 od::status_name(st));
    return abort_code_for(st);
}

std::uint32_t SdoServer::write_checked(const std::vector<std::uint8_t> &data)
{
    const od::Status st = store_.write(session_.index, session_.subindex, data, true);
    if (st != od::Status::Ok)
        LOG_INFO("write 0x%04X:%02X (%zu bytes) refused: %s", session_.index, session_.subindex,
                 data.size(), od::status_name(st));
    return abort_code_for(st);
}

od::Status SdoServer::upload(std::uint16_t index, std::uint8_t subindex,
                             std::vector<std::uint8_t> &out)
{
    return store_.read(index, subindex, out, false);
}

od::Status SdoServer::download(std::uint16_t index, std::uint8_t subindex,
                               const std::vector<std::uint8_t> &data)
{
    return store_.write(index, subindex, data, false);
}

}  // namespace sdo
