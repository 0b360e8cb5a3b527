#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

/*
Every SDO frame is 8 bytes, little-endian:

  [0]    command byte: ccs/scs in bits 7..5, family-specific flags below
  [1..2] object index       (initiate, abort)
  [3]    object subindex    (initiate, abort)
  [4..7] data / size / abort code

Segment frames (segmented and block) reuse bytes 1..7 as payload.
Block-download data segments put c(1b)|seqno(7b) in byte 0, so their top
3 bits do NOT identify a command family.
*/

namespace sdo
{

inline constexpr std::size_t FRAME_SIZE       = 8;
inline constexpr std::size_t SEGMENT_PAYLOAD  = 7;
inline constexpr std::size_t EXPEDITED_MAX    = 4;
inline constexpr std::uint8_t MAX_BLOCK_SIZE  = 127;
inline constexpr std::uint8_t COMMAND_MASK    = 0xE0;
inline constexpr std::uint8_t SEQUENCE_MASK   = 0x7F;

using FrameBytes = std::array<std::uint8_t, FRAME_SIZE>;

// --- Client command specifiers ---
inline constexpr std::uint8_t REQUEST_SEGMENT_DOWNLOAD = 0 << 5;
inline constexpr std::uint8_t REQUEST_DOWNLOAD         = 1 << 5;
inline constexpr std::uint8_t REQUEST_UPLOAD           = 2 << 5;
inline constexpr std::uint8_t REQUEST_SEGMENT_UPLOAD   = 3 << 5;
inline constexpr std::uint8_t REQUEST_ABORTED          = 4 << 5;
inline constexpr std::uint8_t REQUEST_BLOCK_UPLOAD     = 5 << 5;
inline constexpr std::uint8_t REQUEST_BLOCK_DOWNLOAD   = 6 << 5;

// --- Server command specifiers ---
inline constexpr std::uint8_t RESPONSE_SEGMENT_UPLOAD   = 0 << 5;
inline constexpr std::uint8_t RESPONSE_SEGMENT_DOWNLOAD = 1 << 5;
inline constexpr std::uint8_t RESPONSE_UPLOAD           = 2 << 5;
inline constexpr std::uint8_t RESPONSE_DOWNLOAD         = 3 << 5;
inline constexpr std::uint8_t RESPONSE_ABORTED          = 4 << 5;
inline constexpr std::uint8_t RESPONSE_BLOCK_DOWNLOAD   = 5 << 5;
inline constexpr std::uint8_t RESPONSE_BLOCK_UPLOAD     = 6 << 5;

// --- Block sub-commands (bits 1..0) ---
inline constexpr std::uint8_t INITIATE_BLOCK_TRANSFER = 0;
inline constexpr std::uint8_t END_BLOCK_TRANSFER      = 1;
inline constexpr std::uint8_t BLOCK_TRANSFER_RESPONSE = 2;
inline constexpr std::uint8_t START_BLOCK_UPLOAD      = 3;
inline constexpr std::uint8_t SUBCOMMAND_MASK         = 0x03;

// --- Flags ---
inline constexpr std::uint8_t EXPEDITED            = 0x02;
inline constexpr std::uint8_t SIZE_SPECIFIED       = 0x01;
inline constexpr std::uint8_t BLOCK_SIZE_SPECIFIED = 0x02;
inline constexpr std::uint8_t CRC_SUPPORTED        = 0x04;
inline constexpr std::uint8_t NO_MORE_DATA         = 0x01;
inline constexpr std::uint8_t NO_MORE_BLOCKS       = 0x80;
inline constexpr std::uint8_t TOGGLE_BIT           = 0x10;

// --- Abort codes ---
inline constexpr std::uint32_t ABORT_NONE                      = 0x00000000;
inline constexpr std::uint32_t ABORT_TOGGLE_NOT_ALTERNATED     = 0x05030000;
inline constexpr std::uint32_t ABORT_TIMED_OUT                 = 0x05040000;
inline constexpr std::uint32_t ABORT_INVALID_COMMAND_SPECIFIER = 0x05040001;
inline constexpr std::uint32_t ABORT_INVALID_BLOCK_SIZE        = 0x05040002;
inline constexpr std::uint32_t ABORT_INVALID_SEQUENCE_NUMBER   = 0x05040003;
inline constexpr std::uint32_t ABORT_CRC_ERROR                 = 0x05040004;
inline constexpr std::uint32_t ABORT_OUT_OF_MEMORY             = 0x05040005;
inline constexpr std::uint32_t ABORT_UNSUPPORTED_ACCESS        = 0x06010000;
inline constexpr std::uint32_t ABORT_WRITE_ONLY                = 0x06010001;
inline constexpr std::uint32_t ABORT_READ_ONLY                 = 0x06010002;
inline constexpr std::uint32_t ABORT_NOT_IN_OD                 = 0x06020000;
inline constexpr std::uint32_t ABORT_PARAMETER_LENGTH          = 0x06070010;
inline constexpr std::uint32_t ABORT_PARAMETER_LENGTH_HIGH     = 0x06070012;
inline constexpr std::uint32_t ABORT_PARAMETER_LENGTH_LOW      = 0x06070013;
inline constexpr std::uint32_t ABORT_NO_SUCH_SUBINDEX          = 0x06090011;
inline constexpr std::uint32_t ABORT_VALUE_RANGE               = 0x06090030;
inline constexpr std::uint32_t ABORT_RESOURCE_NOT_AVAILABLE    = 0x060A0023;
inline constexpr std::uint32_t ABORT_GENERAL_ERROR             = 0x08000000;
inline constexpr std::uint32_t ABORT_STORE_APPLICATION         = 0x08000020;
inline constexpr std::uint32_t ABORT_NO_DATA_AVAILABLE         = 0x08000024;

const char *abort_name(std::uint32_t code);

// Command family of an inbound request, taken from the top 3 bits only.
enum class Command
{
    SegmentDownload,
    InitiateDownload,
    InitiateUpload,
    SegmentUpload,
    Abort,
    BlockUpload,
    BlockDownload,
    Unknown
};

Command     classify(std::uint8_t command);
const char *command_name(Command c);

// --- little-endian field access ---
inline std::uint16_t get_u16(const std::uint8_t *p)
{
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

inline std::uint32_t get_u32(const std::uint8_t *p)
{
    return (std::uint32_t)p[0] | ((std::uint32_t)p[1] << 8) | ((std::uint32_t)p[2] << 16) |
           ((std::uint32_t)p[3] << 24);
}

inline void put_u16(std::uint8_t *p, std::uint16_t v)
{
    p[0] = static_cast<std::uint8_t>(v & 0xFF);
    p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
}

inline void put_u32(std::uint8_t *p, std::uint32_t v)
{
    p[0] = static_cast<std::uint8_t>(v & 0xFF);
    p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    p[2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
    p[3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
}

// [command][index lo][index hi][subindex], the header of initiate and abort frames
inline void pack_header(FrameBytes &f, std::uint8_t command, std::uint16_t index,
                        std::uint8_t subindex)
{
    f[0] = command;
    put_u16(&f[1], index);
    f[3] = subindex;
}

FrameBytes make_abort(std::uint16_t index, std::uint8_t subindex, std::uint32_t code);

}  // namespace sdo
