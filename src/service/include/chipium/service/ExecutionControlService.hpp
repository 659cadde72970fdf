// Copyright © 2026 The Chipium Authors
//
// This file is part of Chipium.
//
// Chipium is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Chipium is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Chipium.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef CHIPIUM_SERVICE_EXECUTION_CONTROL_SERVICE_HPP
#define CHIPIUM_SERVICE_EXECUTION_CONTROL_SERVICE_HPP

#include "control.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <mutex>

namespace chipium {

class Machine;

namespace service {

/// gRPC service for pausing, resuming, resetting and single-stepping
class ExecutionControlServiceImpl final : public ExecutionControl::Service {
public:
    explicit ExecutionControlServiceImpl(Machine& machine);
    ~ExecutionControlServiceImpl() override;

    // Non-copyable
    ExecutionControlServiceImpl(const ExecutionControlServiceImpl&) = delete;
    ExecutionControlServiceImpl& operator=(const ExecutionControlServiceImpl&) = delete;

    grpc::Status GetState(
        grpc::ServerContext* context,
        const Empty* request,
        ExecutionState* response) override;

    grpc::Status Run(
        grpc::ServerContext* context,
        const Empty* request,
        RunResponse* response) override;

    grpc::Status Stop(
        grpc::ServerContext* context,
        const Empty* request,
        StopResponse* response) override;

    grpc::Status Reset(
        grpc::ServerContext* context,
        const Empty* request,
        ResetResponse* response) override;

    grpc::Status StepInstruction(
        grpc::ServerContext* context,
        const StepRequest* request,
        StepResponse* response) override;

private:
    void fill_execution_state(ExecutionState* state);

    Machine& machine_;
    std::mutex mutex_;  // Serialises control requests against each other
};

} // namespace service
} // namespace chipium

#endif // CHIPIUM_SERVICE_EXECUTION_CONTROL_SERVICE_HPP
