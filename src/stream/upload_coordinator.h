#pragma once

#include "coordinator.h"
#include "byte_io.h"

namespace stream {

// Producer side: pumps a request body into the slot channel.
class UploadCoordinator : public Coordinator {
public:
    using Coordinator::Coordinator;

    Result upload(const StreamKey& key, ByteSource& source);

private:
    Result pump(const StreamSlot::Ptr& slot, ByteSource& source);
};

} // namespace stream
