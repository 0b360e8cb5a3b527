#include "proto/sdo.hpp"

namespace sdo
{

const char *abort_name(std::uint32_t code)
{
    switch (code)
    {
        case ABORT_NONE:
            return "no error";
        case ABORT_TOGGLE_NOT_ALTERNATED:
            return "toggle bit not alternated";
        case ABORT_TIMED_OUT:
            return "SDO protocol timed out";
        case ABORT_INVALID_COMMAND_SPECIFIER:
            return "command specifier not valid or unknown";
        case ABORT_INVALID_BLOCK_SIZE:
            return "invalid block size";
        case ABORT_INVALID_SEQUENCE_NUMBER:
            return "invalid sequence number";
        case ABORT_CRC_ERROR:
            return "CRC error";
        case ABORT_OUT_OF_MEMORY:
            return "out of memory";
        case ABORT_UNSUPPORTED_ACCESS:
            return "unsupported access to an object";
        case ABORT_WRITE_ONLY:
            return "attempt to read a write only object";
        case ABORT_READ_ONLY:
            return "attempt to write a read only object";
        case ABORT_NOT_IN_OD:
            return "object does not exist in the object dictionary";
        case ABORT_PARAMETER_LENGTH:
            return "length of service parameter does not match";
        case ABORT_PARAMETER_LENGTH_HIGH:
            return "length of service parameter too high";
        case ABORT_PARAMETER_LENGTH_LOW:
            return "length of service parameter too low";
        case ABORT_NO_SUCH_SUBINDEX:
            return "sub-index does not exist";
        case ABORT_VALUE_RANGE:
            return "invalid value for parameter";
        case ABORT_RESOURCE_NOT_AVAILABLE:
            return "resource not available";
        case ABORT_GENERAL_ERROR:
            return "general error";
        case ABORT_STORE_APPLICATION:
            return "data cannot be transferred or stored to the application";
        case ABORT_NO_DATA_AVAILABLE:
            return "no data available";
    }
    return "unknown abort code";
}

Command classify(std::uint8_t command)
{
    switch (command & COMMAND_MASK)
    {
        case REQUEST_SEGMENT_DOWNLOAD:
            return Command::SegmentDownload;
        case REQUEST_DOWNLOAD:
            return Command::InitiateDownload;
        case REQUEST_UPLOAD:
            return Command::InitiateUpload;
        case REQUEST_SEGMENT_UPLOAD:
            return Command::SegmentUpload;
        case REQUEST_ABORTED:
            return Command::Abort;
        case REQUEST_BLOCK_UPLOAD:
            return Command::BlockUpload;
        case REQUEST_BLOCK_DOWNLOAD:
            return Command::BlockDownload;
        default:
            return Command::Unknown;
    }
}

const char *command_name(Command c)
{
    switch (c)
    {
        case Command::SegmentDownload:
            return "segment-download";
        case Command::InitiateDownload:
            return "initiate-download";
        case Command::InitiateUpload:
            return "initiate-upload";
        case Command::SegmentUpload:
            return "segment-upload";
        case Command::Abort:
            return "abort";
        case Command::BlockUpload:
            return "block-upload";
        case Command::BlockDownload:
            return "block-download";
        case Command::Unknown:
            return "unknown";
    }
    return "?";
}

FrameBytes make_abort(std::uint16_t index, std::uint8_t subindex, std::uint32_t code)
{
    FrameBytes f{};
    pack_header(f, RESPONSE_ABORTED, index, subindex);
    put_u32(&f[4], code);
    return f;
}

}  // namespace sdo
