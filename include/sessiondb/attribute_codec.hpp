// include/sessiondb/attribute_codec.hpp
// Purpose: Conversion between a session's attribute map and the opaque payload column

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <memory>
#include <string>

namespace sessiondb {

// The statement builder never looks inside the payload; only the data store
// calls a codec. Implementations throw CodecError.
class AttributeCodec {
public:
    virtual ~AttributeCodec() = default;

    virtual Blob encode(const Properties& attributes) const = 0;
    virtual Properties decode(const Blob& payload) const = 0;

    virtual std::string name() const = 0;
};

// JSON object, one member per attribute. An empty payload decodes to an empty map.
class JsonAttributeCodec : public AttributeCodec {
public:
    explicit JsonAttributeCodec(size_t max_payload_size = Constants::MAX_PAYLOAD_SIZE);

    Blob encode(const Properties& attributes) const override;
    Properties decode(const Blob& payload) const override;

    std::string name() const override { return "json"; }
    size_t max_payload_size() const noexcept { return max_payload_size_; }

private:
    size_t max_payload_size_;
};

std::shared_ptr<AttributeCodec> make_default_codec();

} // namespace sessiondb
