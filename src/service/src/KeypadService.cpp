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

#include "chipium/service/KeypadService.hpp"
#include "chipium/Keypad.hpp"

namespace chipium::service {

KeypadServiceImpl::KeypadServiceImpl(Keypad& keypad)
    : keypad_(keypad) {
}

KeypadServiceImpl::~KeypadServiceImpl() = default;

grpc::Status KeypadServiceImpl::KeyDown(
    grpc::ServerContext* /*context*/,
    const KeyRequest* request,
    KeyResponse* response) {

    uint32_t key = request->key();
    if (key >= Keypad::NUM_KEYS) {
        response->set_accepted(false);
        return grpc::Status::OK;
    }

    keypad_.key_down(static_cast<uint8_t>(key));
    response->set_accepted(true);

    return grpc::Status::OK;
}

grpc::Status KeypadServiceImpl::KeyUp(
    grpc::ServerContext* /*context*/,
    const KeyRequest* request,
    KeyResponse* response) {

    uint32_t key = request->key();
    if (key >= Keypad::NUM_KEYS) {
        response->set_accepted(false);
        return grpc::Status::OK;
    }

    keypad_.key_up(static_cast<uint8_t>(key));
    response->set_accepted(true);

    return grpc::Status::OK;
}

grpc::Status KeypadServiceImpl::GetState(
    grpc::ServerContext* /*context*/,
    const GetKeypadStateRequest* /*request*/,
    KeypadState* response) {

    response->set_pressed_keys(keypad_.state());
    return grpc::Status::OK;
}

} // namespace chipium::service
