#include "subcommand.hpp"
#include <iostream>
#include "protocol/nt_transact.hpp"

namespace nttrans {

SubcommandCompletion::SubcommandCompletion(std::string subcommand, Function fn)
    : state_(std::make_shared<State>()) {
    state_->subcommand = std::move(subcommand);
    state_->fn = std::move(fn);
}

void SubcommandCompletion::operator()(protocol::SubcommandResult result) const {
    if (state_->fired.exchange(true)) {
        std::cerr << "NtTransact: [" << protocol::to_upper(state_->subcommand)
                  << "] completion invoked more than once, result dropped\n";
        return;
    }
    state_->fn(std::move(result));
}

} // namespace nttrans
