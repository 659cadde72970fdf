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

#include "chipium/service/ExecutionControlService.hpp"
#include "chipium/Machine.hpp"

#include <exception>

namespace chipium::service {

ExecutionControlServiceImpl::ExecutionControlServiceImpl(Machine& machine)
    : machine_(machine) {
}

ExecutionControlServiceImpl::~ExecutionControlServiceImpl() = default;

void ExecutionControlServiceImpl::fill_execution_state(ExecutionState* state) {
    const auto snap = machine_.snapshot();

    state->set_is_running(!machine_.is_paused());
    state->set_is_faulted(machine_.is_faulted());
    state->set_halt_reason(machine_.halt_reason());
    state->set_sequence(machine_.sequence());
    state->set_instruction_count(snap.instruction_count);
    state->set_pc(snap.pc);
    state->set_index(snap.index);
    state->set_delay_timer(snap.delay_timer);
    state->set_sound_timer(snap.sound_timer);
    state->set_awaiting_key(snap.awaiting_key);
    state->set_registers(snap.registers.data(), snap.registers.size());
}

grpc::Status ExecutionControlServiceImpl::GetState(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ExecutionState* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    fill_execution_state(response);
    return grpc::Status::OK;
}

grpc::Status ExecutionControlServiceImpl::Run(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    RunResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    if (!machine_.is_paused()) {
        response->set_success(false);
        response->set_error("already running");
        return grpc::Status::OK;
    }

    if (!machine_.resume()) {
        response->set_success(false);
        response->set_error("machine faulted; reset required");
        return grpc::Status::OK;
    }

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status ExecutionControlServiceImpl::Stop(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    StopResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    if (!machine_.is_paused()) {
        machine_.pause("stopped by client");
    }
    response->set_success(true);
    fill_execution_state(response->mutable_state());
    return grpc::Status::OK;
}

grpc::Status ExecutionControlServiceImpl::Reset(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ResetResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    machine_.reset();
    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status ExecutionControlServiceImpl::StepInstruction(
    grpc::ServerContext* /*context*/,
    const StepRequest* request,
    StepResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    if (!machine_.is_paused()) {
        response->set_success(false);
        response->set_error("machine is running");
        return grpc::Status::OK;
    }

    uint32_t count = request->count();
    if (count == 0) count = 1;

    uint32_t steps = 0;
    try {
        for (uint32_t i = 0; i < count; ++i) {
            machine_.step_instruction();
            ++steps;
        }
        response->set_success(true);
    } catch (const std::exception& e) {
        // The machine has already faulted and recorded the reason
        response->set_success(false);
        response->set_error(e.what());
    }

    response->set_steps_executed(steps);
    fill_execution_state(response->mutable_state());
    return grpc::Status::OK;
}

} // namespace chipium::service
