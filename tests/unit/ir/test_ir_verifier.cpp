// File: tests/unit/ir/test_ir_verifier.cpp
// Purpose: Verify structural checks at both verification stages.
// Key invariants: A lowered module holds no object-model opcode and no symbolic slot.
// Ownership/Lifetime: Tests own their modules.
// Links: docs/lowering.md

#include <gtest/gtest.h>

#include "ir/build/IRBuilder.hpp"
#include "ir/core/Module.hpp"
#include "ir/utils/Utils.hpp"
#include "ir/verify/Verifier.hpp"

#include <sstream>

using namespace kiln;
using core::Opcode;
using core::Type;
using core::Value;

namespace
{

core::ClassId addPoint(build::IRBuilder &b)
{
    core::ClassDecl decl;
    decl.name = "Point";
    decl.fields = {{"x", Type(Type::Kind::I64)}};
    return b.addClass(std::move(decl));
}

core::Function &beginMain(build::IRBuilder &b, Type ret)
{
    core::Function &fn = b.startFunction("main", ret, {});
    b.createBlock(fn, "entry");
    b.setInsertPoint(*util::findBlock(fn, "entry"));
    return fn;
}

} // namespace

TEST(VerifierTest, ObjectModelIsAllowedOnlyBeforeLowering)
{
    core::Module m;
    build::IRBuilder b(m);
    core::ClassId point = addPoint(b);
    beginMain(b, Type(Type::Kind::Ptr));
    b.ret({b.objNew(point, {Value::constInt(1)})});

    EXPECT_TRUE(verify::Verifier::verify(m, verify::Stage::HighLevel));
    auto lowered = verify::Verifier::verify(m, verify::Stage::Lowered);
    ASSERT_FALSE(lowered);
    EXPECT_NE(lowered.error().message.find("survived lowering"), std::string::npos);
    EXPECT_NE(lowered.error().message.find("@main:entry"), std::string::npos);
}

TEST(VerifierTest, SymbolicSlotIsRejectedAfterLowering)
{
    core::Module m;
    build::IRBuilder b(m);
    core::Function &fn = b.startFunction("main", Type(Type::Kind::Ptr), {{"vt", Type(Type::Kind::Ptr)}});
    b.createBlock(fn, "entry");
    b.setInsertPoint(*util::findBlock(fn, "entry"));
    b.ret({b.load(Type(Type::Kind::Ptr), Value::temp(fn.params[0].id), Value::vtableSlot(0))});

    EXPECT_TRUE(verify::Verifier::verify(m, verify::Stage::HighLevel));
    auto lowered = verify::Verifier::verify(m, verify::Stage::Lowered);
    ASSERT_FALSE(lowered);
    EXPECT_NE(lowered.error().message.find("unresolved vtable slot"), std::string::npos);
}

TEST(VerifierTest, UndefinedTemporaryIsRejected)
{
    core::Module m;
    build::IRBuilder b(m);
    beginMain(b, Type(Type::Kind::I64));
    b.ret({Value::temp(42)});
    auto r = verify::Verifier::verify(m);
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("%t42"), std::string::npos);
}

TEST(VerifierTest, BlockMustEndWithTerminator)
{
    core::Module m;
    build::IRBuilder b(m);
    core::Function &fn = beginMain(b, Type(Type::Kind::I64));
    b.add(Type(Type::Kind::I64), Value::constInt(1), Value::constInt(2));
    ASSERT_FALSE(fn.blocks.front().terminated);
    auto r = verify::Verifier::verify(m);
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("terminator"), std::string::npos);
}

TEST(VerifierTest, SuccessorArgumentsMustMatchParameters)
{
    core::Module m;
    build::IRBuilder b(m);
    core::Function &fn = beginMain(b, Type(Type::Kind::I64));
    b.createBlock(fn, "next", {{"v", Type(Type::Kind::I64)}});
    b.setInsertPoint(*util::findBlock(fn, "entry"));
    b.br("next");
    b.setInsertPoint(*util::findBlock(fn, "next"));
    b.ret({b.blockParam(*util::findBlock(fn, "next"), 0)});

    auto r = verify::Verifier::verify(m);
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("argument count mismatch"), std::string::npos);
}

TEST(VerifierTest, ClassTableMustBeDense)
{
    core::Module m;
    core::ClassDecl decl;
    decl.id = 3;
    decl.name = "Stray";
    m.classes.push_back(decl);
    auto r = verify::Verifier::verify(m);
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("table index 0"), std::string::npos);
}

TEST(VerifierTest, UnknownCalleeIsRejected)
{
    core::Module m;
    build::IRBuilder b(m);
    beginMain(b, Type(Type::Kind::Void));
    b.call("missing", Type(Type::Kind::Void), {});
    b.ret();
    auto r = verify::Verifier::verify(m);
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("unknown callee @missing"), std::string::npos);
}

TEST(VerifierTest, FailurePrintsAsAnError)
{
    core::Module m;
    build::IRBuilder b(m);
    beginMain(b, Type(Type::Kind::Void));
    b.call("missing", Type(Type::Kind::Void), {});
    b.ret();
    auto r = verify::Verifier::verify(m);
    ASSERT_FALSE(r);
    std::ostringstream os;
    support::printDiag(r.error(), os);
    EXPECT_EQ(os.str().rfind("error: @main:entry: call: ", 0), 0u);
}
