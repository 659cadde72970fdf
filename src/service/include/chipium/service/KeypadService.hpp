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

#ifndef CHIPIUM_SERVICE_KEYPAD_SERVICE_HPP
#define CHIPIUM_SERVICE_KEYPAD_SERVICE_HPP

#include "keypad.grpc.pb.h"
#include <grpcpp/grpcpp.h>

namespace chipium {

class Keypad;

namespace service {

/// gRPC service implementation for keypad input
class KeypadServiceImpl final : public KeypadService::Service {
public:
    explicit KeypadServiceImpl(Keypad& keypad);
    ~KeypadServiceImpl() override;

    // Non-copyable
    KeypadServiceImpl(const KeypadServiceImpl&) = delete;
    KeypadServiceImpl& operator=(const KeypadServiceImpl&) = delete;

    grpc::Status KeyDown(
        grpc::ServerContext* context,
        const KeyRequest* request,
        KeyResponse* response) override;

    grpc::Status KeyUp(
        grpc::ServerContext* context,
        const KeyRequest* request,
        KeyResponse* response) override;

    grpc::Status GetState(
        grpc::ServerContext* context,
        const GetKeypadStateRequest* request,
        KeypadState* response) override;

private:
    // Keypad is atomic, so no lock is needed here
    Keypad& keypad_;
};

} // namespace service
} // namespace chipium

#endif // CHIPIUM_SERVICE_KEYPAD_SERVICE_HPP
