#include <gtest/gtest.h>
#include "vim/Registers.h"

using namespace ll;

TEST (Registers, StartsEmpty)
{
    Registers r;
    EXPECT_TRUE (r.isEmpty());
    EXPECT_TRUE (r.get().isEmpty());
    EXPECT_TRUE (r.get ('5').isEmpty());
}

TEST (Registers, YankFillsUnnamedAndZero)
{
    Registers r;
    r.store ("text", false, Registers::Yank);

    EXPECT_EQ (r.get().text, "text");
    EXPECT_EQ (r.get ('0').text, "text");
    EXPECT_TRUE (r.get ('1').isEmpty());
}

TEST (Registers, DeletesRotateThroughNumberedRegisters)
{
    Registers r;

    for (int i = 1; i <= 10; ++i)
        r.store ("d" + juce::String (i), true, Registers::Delete);

    EXPECT_EQ (r.get().text, "d10");
    EXPECT_EQ (r.get ('1').text, "d10");
    EXPECT_EQ (r.get ('2').text, "d9");
    EXPECT_EQ (r.get ('9').text, "d2");
    EXPECT_TRUE (r.get ('1').linewise);
    EXPECT_TRUE (r.get ('0').isEmpty());
}

TEST (Registers, SmallDeleteOnlyTouchesUnnamed)
{
    Registers r;
    r.store ("yanked", false, Registers::Yank);
    r.store ("x", false, Registers::SmallDelete);

    EXPECT_EQ (r.get().text, "x");
    EXPECT_EQ (r.get ('0').text, "yanked");
    EXPECT_TRUE (r.get ('1').isEmpty());
}

TEST (Registers, Clear)
{
    Registers r;
    r.store ("a", false, Registers::Yank);
    r.store ("b", false, Registers::Delete);
    r.clear();

    EXPECT_TRUE (r.isEmpty());
    EXPECT_TRUE (r.get ('0').isEmpty());
    EXPECT_TRUE (r.get ('1').isEmpty());
}
