#include "od/object_store.hpp"
#include "util/log.hpp"

namespace od
{

const char *status_name(Status s)
{
    switch (s)
    {
        case Status::Ok:
            return "ok";
        case Status::NoSuchObject:
            return "no such object";
        case Status::NoSuchSubindex:
            return "no such subindex";
        case Status::NotReadable:
            return "not readable";
        case Status::NotWritable:
            return "not writable";
        case Status::LengthMismatch:
            return "length mismatch";
        case Status::LengthTooHigh:
            return "length too high";
        case Status::ValueRejected:
            return "value rejected";
        case Status::NoValue:
            return "no value";
    }
    return "?";
}

Status MemoryObjectStore::lookup(std::uint16_t index, std::uint8_t subindex, Entry *&out)
{
    auto it = entries_.find(Key{index, subindex});
    if (it != entries_.end())
    {
        out = &it->second;
        return Status::Ok;
    }
    // distinguish "object missing" from "object exists, subindex missing"
    auto lb = entries_.lower_bound(Key{index, 0});
    if (lb != entries_.end() && lb->first.first == index)
        return Status::NoSuchSubindex;
    return Status::NoSuchObject;
}

Status MemoryObjectStore::read(std::uint16_t index, std::uint8_t subindex,
                               std::vector<std::uint8_t> &out, bool check_readable)
{
    Entry *e  = nullptr;
    Status st = lookup(index, subindex, e);
    if (st != Status::Ok)
        return st;
    if (check_readable && e->access == Access::WriteOnly)
        return Status::NotReadable;

    for (const auto &cb : read_cbs_)
    {
        if (auto v = cb(index, subindex))
        {
            out = std::move(*v);
            return Status::Ok;
        }
    }
    if (!e->value)
        return Status::NoValue;
    out = *e->value;
    return Status::Ok;
}

Status MemoryObjectStore::write(std::uint16_t index, std::uint8_t subindex,
                                const std::vector<std::uint8_t> &data, bool check_writable)
{
    Entry *e  = nullptr;
    Status st = lookup(index, subindex, e);
    if (st != Status::Ok)
        return st;
    if (check_writable && (e->access == Access::ReadOnly || e->access == Access::Const))
        return Status::NotWritable;
    if (e->fixed_size != 0 && data.size() != e->fixed_size)
    {
        LOG_DEBUG("0x%04X:%02X expects %zu bytes, got %zu", index, subindex, e->fixed_size,
                  data.size());
        return Status::LengthMismatch;
    }
    if (e->max_size != 0 && data.size() > e->max_size)
        return Status::LengthTooHigh;

    e->value = data;
    for (const auto &cb : write_cbs_)
        cb(index, subindex, *e->value);
    return Status::Ok;
}

bool MemoryObjectStore::add(std::uint16_t index, std::uint8_t subindex, Entry e)
{
    if (e.fixed_size != 0 && e.value && e.value->size() != e.fixed_size)
    {
        LOG_ERROR("0x%04X:%02X '%s': default value has %zu bytes, type needs %zu", index,
                  subindex, e.name.c_str(), e.value->size(), e.fixed_size);
        return false;
    }
    auto res = entries_.emplace(Key{index, subindex}, std::move(e));
    if (!res.second)
    {
        LOG_ERROR("0x%04X:%02X already defined", index, subindex);
        return false;
    }
    return true;
}

bool MemoryObjectStore::add_u8(std::uint16_t index, std::uint8_t subindex,
                               const std::string &name, Access a, std::uint8_t v)
{
    return add(index, subindex, Entry{name, a, 1, 0, std::vector<std::uint8_t>{v}});
}

bool MemoryObjectStore::add_u16(std::uint16_t index, std::uint8_t subindex,
                                const std::string &name, Access a, std::uint16_t v)
{
    std::vector<std::uint8_t> raw = {static_cast<std::uint8_t>(v & 0xFF),
                                     static_cast<std::uint8_t>((v >> 8) & 0xFF)};
    return add(index, subindex, Entry{name, a, 2, 0, std::move(raw)});
}

bool MemoryObjectStore::add_u32(std::uint16_t index, std::uint8_t subindex,
                                const std::string &name, Access a, std::uint32_t v)
{
    std::vector<std::uint8_t> raw = {
        static_cast<std::uint8_t>(v & 0xFF), static_cast<std::uint8_t>((v >> 8) & 0xFF),
        static_cast<std::uint8_t>((v >> 16) & 0xFF), static_cast<std::uint8_t>((v >> 24) & 0xFF)};
    return add(index, subindex, Entry{name, a, 4, 0, std::move(raw)});
}

bool MemoryObjectStore::add_string(std::uint16_t index, std::uint8_t subindex,
                                   const std::string &name, Access a, const std::string &v,
                                   std::size_t max_size)
{
    return add(index, subindex,
               Entry{name, a, 0, max_size, std::vector<std::uint8_t>(v.begin(), v.end())});
}

const Entry *MemoryObjectStore::find(std::uint16_t index, std::uint8_t subindex) const
{
    auto it = entries_.find(Key{index, subindex});
    return it == entries_.end() ? nullptr : &it->second;
}

}  // namespace od
