#pragma once

#include "coordinator.h"
#include "byte_io.h"

namespace stream {

// Consumer side: drains the slot channel into a response sink.
class DownloadCoordinator : public Coordinator {
public:
    using Coordinator::Coordinator;

    Result download(const StreamKey& key, ByteSink& sink);

private:
    Result drain(const StreamSlot::Ptr& slot, ByteSink& sink);
};

} // namespace stream
