#pragma once

#include <gmock/gmock.h>
#include "subcommand.hpp"

namespace smbtx::tests {

class MockSubcommandHandler {
public:
    MOCK_METHOD(void, Handle, (const nttrans::SubcommandRequest& request,
                               nttrans::SubcommandCompletion completion), ());

    nttrans::SubcommandHandler AsHandler() {
        return [this](const nttrans::SubcommandRequest& request, nttrans::SubcommandCompletion completion) {
            Handle(request, std::move(completion));
        };
    }
};

} // namespace smbtx::tests
