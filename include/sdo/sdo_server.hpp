#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "od/object_store.hpp"
#include "proto/crc.hpp"
#include "proto/sdo.hpp"
#include "transport/itransport.hpp"

/*
RX (client request, COB-ID 0x600 + node):
transport.on_rx(frame)
  -> SdoServer::handle_incoming_frame(frame)
       -> dispatch(mode, command family)
            -> expedited / segmented handler   (sdo_segmented.cpp)
            -> block upload handler            (sdo_block_upload.cpp)
            -> block download handler          (sdo_block_download.cpp)
       -> handler returns an abort code (0 = ok)
       -> non-zero: session reset + abort frame

TX (server response, COB-ID 0x580 + node):
send_response(8 bytes) -> transport.send(frame)
*/

namespace sdo
{

enum class Mode
{
    Idle,
    SegmentedUpload,
    SegmentedDownload,
    BlockUpload,
    BlockDownload
};

enum class BlockPhase
{
    None,
    Initiated,    // upload: initiate answered, waiting for start
    AwaitingAck,  // upload: a window is on the wire
    Receiving,    // download: data segments expected
    AwaitingEnd   // download: last segment acked, end frame expected
};

const char *mode_name(Mode m);

// Transfer state of one server endpoint. At most one transfer is open.
struct Session
{
    std::uint16_t             index{0};
    std::uint8_t              subindex{0};
    Mode                      mode{Mode::Idle};
    std::uint8_t              toggle{0};  // 0 or 1
    std::vector<std::uint8_t> buffer;
    std::size_t               cursor{0};  // upload: first byte not yet sent
    std::optional<std::uint32_t> declared_size;

    // block transfer only
    BlockPhase                                phase{BlockPhase::None};
    std::uint8_t                              block_size{MAX_BLOCK_SIZE};
    std::uint8_t                              sequence{0};
    bool                                      crc_enabled{false};
    crc::Crc16                                crc;
    std::array<FrameBytes, MAX_BLOCK_SIZE>    pending{};  // pending[seq - 1]
    std::uint8_t                              pending_count{0};
    std::size_t                               last_segment_len{0};

    std::size_t remaining() const { return buffer.size() - cursor; }
    // Back to Idle. The target (index/subindex) is kept for abort frames.
    void        reset();
};

// Store status -> abort code sent to the client
std::uint32_t abort_code_for(od::Status s);

class SdoServer
{
  public:
    SdoServer(transport::ITransport &tx, od::ObjectStore &store, std::uint32_t tx_cobid);

    // Sole entry point for client requests. Never throws.
    void handle_incoming_frame(const transport::Frame &f, std::uint64_t timestamp_us = 0);

    // Local cancellation: abort frame for the current target, session reset.
    void request_abort(std::uint32_t code = ABORT_GENERAL_ERROR);

    // Code of the last abort notification received from the client
    std::uint32_t last_received_error() const { return last_received_error_; }

    // Direct store access, no protocol involved
    od::Status upload(std::uint16_t index, std::uint8_t subindex,
                      std::vector<std::uint8_t> &out);
    od::Status download(std::uint16_t index, std::uint8_t subindex,
                        const std::vector<std::uint8_t> &data);

    const Session &session() const { return session_; }
    std::uint32_t  tx_cobid() const { return tx_cobid_; }

  private:
    std::uint32_t dispatch(const FrameBytes &req, std::size_t len);

    // expedited / segmented
    std::uint32_t init_upload(const FrameBytes &req);
    std::uint32_t segmented_upload(std::uint8_t command);
    std::uint32_t init_download(const FrameBytes &req);
    std::uint32_t segmented_download(const FrameBytes &req);

    // block upload
    std::uint32_t block_upload(const FrameBytes &req, std::size_t len);
    std::uint32_t init_block_upload(const FrameBytes &req, std::size_t len);
    std::uint32_t start_block_upload();
    std::uint32_t block_upload_ack(const FrameBytes &req, std::size_t len);
    void          send_block_upload_window();
    void          end_block_upload();

    // block download
    std::uint32_t block_download(const FrameBytes &req);
    std::uint32_t init_block_download(const FrameBytes &req);
    std::uint32_t block_download_segment(const FrameBytes &req);
    std::uint32_t end_block_download(const FrameBytes &req);

    // abort / shared
    void          abort(std::uint32_t code = ABORT_GENERAL_ERROR);
    void          on_peer_abort(const FrameBytes &req);
    void          send_response(const FrameBytes &res);
    std::uint32_t read_checked(std::vector<std::uint8_t> &out);
    std::uint32_t write_checked(const std::vector<std::uint8_t> &data);

    transport::ITransport &tx_;
    od::ObjectStore       &store_;
    std::uint32_t          tx_cobid_;
    Session                session_;
    std::uint32_t          last_received_error_{0};
};

}  // namespace sdo
