#pragma once

#include "concurrency/Task.hpp"
#include "host/ServiceHostAdapter.hpp"

#include <memory>
#include <string>

namespace sw::monitor {

struct StatusQueryTask final : concurrency::PromisedTask<types::ServiceStatus> {
    std::shared_ptr<host::ServiceHostAdapter> adapter;
    std::string id;

    StatusQueryTask(std::shared_ptr<host::ServiceHostAdapter> adapter, std::string id)
        : adapter(std::move(adapter)), id(std::move(id)) {}

    void operator()() override {
        try {
            promise.set_value(adapter->queryStatus(id));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

}
