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

#include <catch2/catch_test_macros.hpp>
#include <chipium/Instruction.hpp>

using namespace chipium;

namespace {

Operation operation_of(uint16_t opcode) {
    auto instruction = decode(opcode);
    REQUIRE(instruction.has_value());
    return instruction->operation;
}

std::string mnemonic(uint16_t opcode) {
    auto instruction = decode(opcode);
    REQUIRE(instruction.has_value());
    return to_string(*instruction);
}

} // anonymous namespace

TEST_CASE("Instruction operand fields", "[instruction]") {
    auto instruction = decode(0xD12F);
    REQUIRE(instruction.has_value());

    CHECK(instruction->x() == 0x1);
    CHECK(instruction->y() == 0x2);
    CHECK(instruction->n() == 0xF);
    CHECK(instruction->nn() == 0x2F);
    CHECK(instruction->nnn() == 0x12F);
    CHECK(instruction->opcode == 0xD12F);
}

TEST_CASE("Instruction decode", "[instruction][decode]") {
    SECTION("System group") {
        CHECK(operation_of(0x00E0) == Operation::ClearScreen);
        CHECK(operation_of(0x00EE) == Operation::Return);
    }

    SECTION("Flow control") {
        CHECK(operation_of(0x1234) == Operation::Jump);
        CHECK(operation_of(0x2456) == Operation::Call);
        CHECK(operation_of(0xB300) == Operation::JumpOffset);
    }

    SECTION("Conditional skips") {
        CHECK(operation_of(0x3A12) == Operation::SkipIfEqualImmediate);
        CHECK(operation_of(0x4A12) == Operation::SkipIfNotEqualImmediate);
        CHECK(operation_of(0x5AB0) == Operation::SkipIfEqualRegister);
        CHECK(operation_of(0x9AB0) == Operation::SkipIfNotEqualRegister);
        CHECK(operation_of(0xE59E) == Operation::SkipIfKeyPressed);
        CHECK(operation_of(0xE5A1) == Operation::SkipIfKeyNotPressed);
    }

    SECTION("Register arithmetic group") {
        CHECK(operation_of(0x8AB0) == Operation::Move);
        CHECK(operation_of(0x8AB1) == Operation::Or);
        CHECK(operation_of(0x8AB2) == Operation::And);
        CHECK(operation_of(0x8AB3) == Operation::Xor);
        CHECK(operation_of(0x8AB4) == Operation::AddRegister);
        CHECK(operation_of(0x8AB5) == Operation::Subtract);
        CHECK(operation_of(0x8AB6) == Operation::ShiftRight);
        CHECK(operation_of(0x8AB7) == Operation::SubtractReversed);
        CHECK(operation_of(0x8ABE) == Operation::ShiftLeft);
    }

    SECTION("Timer, key and memory group") {
        CHECK(operation_of(0xF307) == Operation::LoadDelayTimer);
        CHECK(operation_of(0xF30A) == Operation::WaitForKey);
        CHECK(operation_of(0xF315) == Operation::SetDelayTimer);
        CHECK(operation_of(0xF318) == Operation::SetSoundTimer);
        CHECK(operation_of(0xF31E) == Operation::AddIndex);
        CHECK(operation_of(0xF329) == Operation::LoadGlyph);
        CHECK(operation_of(0xF333) == Operation::StoreDecimal);
        CHECK(operation_of(0xF355) == Operation::StoreRegisters);
        CHECK(operation_of(0xF365) == Operation::LoadRegisters);
    }

    SECTION("Unmatched patterns do not decode") {
        CHECK_FALSE(decode(0x0FFF).has_value());
        CHECK_FALSE(decode(0x0000).has_value());
        CHECK_FALSE(decode(0x5AB1).has_value());
        CHECK_FALSE(decode(0x9AB8).has_value());
        CHECK_FALSE(decode(0x8AB8).has_value());
        CHECK_FALSE(decode(0x8ABF).has_value());
        CHECK_FALSE(decode(0xE500).has_value());
        CHECK_FALSE(decode(0xF300).has_value());
        CHECK_FALSE(decode(0xFFFF).has_value());
    }
}

TEST_CASE("Instruction disassembly", "[instruction][disassembly]") {
    CHECK(mnemonic(0x00E0) == "CLS");
    CHECK(mnemonic(0x00EE) == "RET");
    CHECK(mnemonic(0x1228) == "JP 0x228");
    CHECK(mnemonic(0x2ABC) == "CALL 0xABC");
    CHECK(mnemonic(0x6A2F) == "LD VA, 0x2F");
    CHECK(mnemonic(0x7105) == "ADD V1, 0x05");
    CHECK(mnemonic(0x8124) == "ADD V1, V2");
    CHECK(mnemonic(0x8016) == "SHR V0");
    CHECK(mnemonic(0xA22A) == "LD I, 0x22A");
    CHECK(mnemonic(0xB200) == "JP V0, 0x200");
    CHECK(mnemonic(0xC3FF) == "RND V3, 0xFF");
    CHECK(mnemonic(0xD015) == "DRW V0, V1, 5");
    CHECK(mnemonic(0xE49E) == "SKP V4");
    CHECK(mnemonic(0xF00A) == "LD V0, K");
    CHECK(mnemonic(0xF533) == "LD B, V5");
    CHECK(mnemonic(0xFE55) == "LD [I], VE");
    CHECK(mnemonic(0xFE65) == "LD VE, [I]");
}
