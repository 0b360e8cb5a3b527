#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace od
{

enum class Status
{
    Ok,
    NoSuchObject,
    NoSuchSubindex,
    NotReadable,
    NotWritable,
    LengthMismatch,
    LengthTooHigh,
    ValueRejected,
    NoValue  // entry exists but holds no value yet
};

const char *status_name(Status s);

enum class Access
{
    ReadOnly,
    WriteOnly,
    ReadWrite,
    Const
};

// Storage the SDO server reads from and writes to.
// check_readable / check_writable = false is local (non-protocol) access.
struct ObjectStore
{
    virtual Status read(std::uint16_t index, std::uint8_t subindex,
                        std::vector<std::uint8_t> &out, bool check_readable) = 0;
    virtual Status write(std::uint16_t index, std::uint8_t subindex,
                         const std::vector<std::uint8_t> &data, bool check_writable) = 0;
    virtual ~ObjectStore() = default;
};

struct Entry
{
    std::string               name;
    Access                    access{Access::ReadWrite};
    std::size_t               fixed_size{0};  // typed scalars; 0 = variable length
    std::size_t               max_size{0};    // 0 = unlimited
    // nullopt until first written; an empty vector is a valid (empty) value
    std::optional<std::vector<std::uint8_t>> value;
};

// A read callback may supply the value of an entry (nullopt = use the stored value).
using ReadCallback = std::function<std::optional<std::vector<std::uint8_t>>(
    std::uint16_t index, std::uint8_t subindex)>;
using WriteCallback = std::function<void(std::uint16_t index, std::uint8_t subindex,
                                         const std::vector<std::uint8_t> &data)>;

class MemoryObjectStore final : public ObjectStore
{
  public:
    Status read(std::uint16_t index, std::uint8_t subindex, std::vector<std::uint8_t> &out,
                bool check_readable) override;
    Status write(std::uint16_t index, std::uint8_t subindex,
                 const std::vector<std::uint8_t> &data, bool check_writable) override;

    bool add(std::uint16_t index, std::uint8_t subindex, Entry e);
    // convenience for typed entries
    bool add_u8(std::uint16_t index, std::uint8_t subindex, const std::string &name, Access a,
                std::uint8_t v);
    bool add_u16(std::uint16_t index, std::uint8_t subindex, const std::string &name, Access a,
                 std::uint16_t v);
    bool add_u32(std::uint16_t index, std::uint8_t subindex, const std::string &name, Access a,
                 std::uint32_t v);
    bool add_string(std::uint16_t index, std::uint8_t subindex, const std::string &name,
                    Access a, const std::string &v, std::size_t max_size = 0);

    void add_read_callback(ReadCallback cb) { read_cbs_.push_back(std::move(cb)); }
    void add_write_callback(WriteCallback cb) { write_cbs_.push_back(std::move(cb)); }

    const Entry *find(std::uint16_t index, std::uint8_t subindex) const;
    std::size_t  size() const { return entries_.size(); }

  private:
    using Key = std::pair<std::uint16_t, std::uint8_t>;

    Status lookup(std::uint16_t index, std::uint8_t subindex, Entry *&out);

    std::map<Key, Entry>       entries_;
    std::vector<ReadCallback>  read_cbs_;
    std::vector<WriteCallback> write_cbs_;
};

}  // namespace od
