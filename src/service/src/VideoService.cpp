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

#include "chipium/service/VideoService.hpp"
#include "chipium/Machine.hpp"

#include <chrono>
#include <thread>

namespace chipium::service {

VideoServiceImpl::VideoServiceImpl(Machine& machine)
    : machine_(machine) {
}

VideoServiceImpl::~VideoServiceImpl() = default;

void VideoServiceImpl::fill_frame(Frame* frame) {
    auto snapshot = machine_.frame_snapshot();
    frame->set_frame_number(snapshot.version);
    frame->set_width(kDisplayWidth);
    frame->set_height(kDisplayHeight);
    frame->set_pixels(snapshot.pixels.data(), snapshot.pixels.size());
}

grpc::Status VideoServiceImpl::SubscribeFrames(
    grpc::ServerContext* context,
    const SubscribeFramesRequest* /*request*/,
    grpc::ServerWriter<Frame>* writer) {

    // The current frame is always sent first
    uint64_t last_version = 0;
    bool first = true;

    while (!context->IsCancelled()) {
        uint64_t current_version = machine_.display_version();

        if (first || current_version != last_version) {
            Frame frame;
            fill_frame(&frame);

            if (!writer->Write(frame)) {
                // Client disconnected
                break;
            }

            last_version = frame.frame_number();
            first = false;
        }

        // Brief sleep to avoid busy-waiting
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    return grpc::Status::OK;
}

grpc::Status VideoServiceImpl::GetFrame(
    grpc::ServerContext* /*context*/,
    const GetFrameRequest* /*request*/,
    Frame* response) {

    fill_frame(response);
    return grpc::Status::OK;
}

grpc::Status VideoServiceImpl::GetConfig(
    grpc::ServerContext* /*context*/,
    const GetConfigRequest* /*request*/,
    VideoConfig* response) {

    response->set_width(kDisplayWidth);
    response->set_height(kDisplayHeight);
    response->set_framerate_hz(Machine::FRAME_RATE_HZ);

    return grpc::Status::OK;
}

} // namespace chipium::service
