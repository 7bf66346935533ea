// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include <frost/pane_sync.h>
#include "fakes.h"

using namespace frost;
using namespace frost_test;


namespace
{
//a native control that reports its own scrolling back, like a real list view does
class EchoingPane : public FakePane
{
public:
    EchoingPane(const NativePane*& focusOwner, PaneId id) : FakePane(focusOwner), id_(id) {}

    void scrollByPixels(int dy) override
    {
        FakePane::scrollByPixels(dy);
        if (sync)
            sync->onVerticalScroll(id_, dy / rowHeight);
    }

    PaneSynchronizer* sync = nullptr;

private:
    const PaneId id_;
};
}


class PaneSyncTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        //frozen: a + c = 200 pixels
        reg.add(makeColumn(L"a", true, true, 120));
        reg.add(makeColumn(L"b"));
        reg.add(makeColumn(L"c", true, true, 80));
        reg.add(makeColumn(L"d"));
    }

    ColumnRegistry reg;
    FakePanes panes;
    PaneSynchronizer sync{reg, panes.pair};
};


TEST_F(PaneSyncTest, LayoutSplitsClientArea)
{
    const PaneLayout layout = calcPaneLayout(reg, 600, 400, 15);

    EXPECT_EQ(layout.frozen, (PaneRect{0, 0, 200, 385})); //frozen pane stops above the normal pane's scroll bar
    EXPECT_EQ(layout.normal, (PaneRect{200, 0, 400, 400}));
}


TEST_F(PaneSyncTest, LayoutIsBoundedByClientArea)
{
    const PaneLayout layout = calcPaneLayout(reg, 150, 10, 15);

    EXPECT_EQ(layout.frozen, (PaneRect{0, 0, 150, 0}));
    EXPECT_EQ(layout.normal, (PaneRect{150, 0, 0, 10}));
}


TEST_F(PaneSyncTest, HiddenFrozenColumnsTakeNoSpace)
{
    reg.setVisible(0, false);
    EXPECT_EQ(calcPaneLayout(reg, 600, 400, 0).frozen.width, 80);

    reg.setVisible(2, false);
    const PaneLayout layout = calcPaneLayout(reg, 600, 400, 0);
    EXPECT_EQ(layout.frozen.width, 0);
    EXPECT_EQ(layout.normal, (PaneRect{0, 0, 600, 400}));
}


TEST_F(PaneSyncTest, UpdateLayoutAppliesBounds)
{
    panes.normal.hScrollBarHeight = 17;
    sync.updateLayout(500, 300);

    EXPECT_EQ(panes.frozen.bounds, (PaneRect{0, 0, 200, 283}));
    EXPECT_EQ(panes.normal.bounds, (PaneRect{200, 0, 300, 300}));
}


TEST_F(PaneSyncTest, ColumnResizeRelayouts)
{
    sync.updateLayout(600, 400);
    sync.onColumnResized(0, 150);

    EXPECT_EQ(reg.getColumn(0).width, 150);
    EXPECT_EQ(panes.frozen.bounds.width, 230);
    EXPECT_EQ(panes.normal.bounds.x, 230);
}


TEST_F(PaneSyncTest, ScrollIsMirroredToOtherPane)
{
    sync.onVerticalScroll(PaneId::normal, 3);
    EXPECT_EQ(panes.frozen.scrolledPixels, (std::vector<int> {60}));

    sync.onVerticalScroll(PaneId::frozen, -2);
    EXPECT_EQ(panes.normal.scrolledPixels, (std::vector<int> {-40}));

    sync.onVerticalScroll(PaneId::normal, 0);
    EXPECT_EQ(panes.frozen.scrolledPixels.size(), 1u);
}


TEST_F(PaneSyncTest, PropagatedScrollDoesNotBounceBack)
{
    const NativePane* focusOwner = nullptr;
    EchoingPane frozen(focusOwner, PaneId::frozen);
    EchoingPane normal(focusOwner, PaneId::normal);
    PanePair pair(frozen, normal);
    PaneSynchronizer echoSync(reg, pair);
    frozen.sync = normal.sync = &echoSync;

    echoSync.onVerticalScroll(PaneId::normal, 5);

    EXPECT_EQ(frozen.scrolledPixels, (std::vector<int> {100}));
    EXPECT_TRUE(normal.scrolledPixels.empty());
}


TEST_F(PaneSyncTest, MouseHoverIsMirrored)
{
    sync.onMouseMove(PaneId::frozen, 45);
    sync.onMouseMove(PaneId::normal, 12);
    sync.onMouseLeave(PaneId::normal);

    EXPECT_EQ(panes.normal.mouseMoves, (std::vector<int> {45}));
    EXPECT_EQ(panes.frozen.mouseMoves, (std::vector<int> {12}));
    EXPECT_EQ(panes.frozen.mouseLeaves, 1);
    EXPECT_EQ(panes.normal.mouseLeaves, 0);
}


TEST_F(PaneSyncTest, WheelIsForwardedFromFrozenPaneOnly)
{
    EXPECT_TRUE(sync.onMouseWheel(PaneId::frozen, -120, 120));
    EXPECT_EQ(panes.normal.wheelRotations, (std::vector<int> {-120}));

    EXPECT_FALSE(sync.onMouseWheel(PaneId::normal, 120, 120)); //normal pane scrolls itself
    EXPECT_TRUE(panes.frozen.wheelRotations.empty());
    EXPECT_EQ(panes.normal.wheelRotations.size(), 1u);
}


TEST_F(PaneSyncTest, NormalPaneEndsUpWithKeyboardFocus)
{
    sync.onMouseDown(PaneId::normal);
    EXPECT_TRUE(panes.frozen.hasFocus());

    sync.onFocusGained(PaneId::frozen);
    EXPECT_TRUE(panes.normal.hasFocus());

    sync.onFocusGained(PaneId::normal);
    EXPECT_TRUE(panes.normal.hasFocus());

    sync.onMouseDown(PaneId::frozen);
    EXPECT_EQ(panes.frozen.focusRequests, 1);
}


TEST_F(PaneSyncTest, WindowActivationRestoresFocusChain)
{
    sync.onWindowActivated(); //nobody has focus
    EXPECT_EQ(panes.frozen.focusRequests, 0);

    panes.normal.setFocus();
    sync.onWindowActivated();
    EXPECT_EQ(panes.frozen.focusRequests, 1);
}


TEST_F(PaneSyncTest, StretchLastColumnFillsNormalPane)
{
    panes.normal.clientWidth = 400;
    int changes = 0;
    reg.setChangeCallback([&] { ++changes; });

    sync.setLastColumnStretched(true);
    EXPECT_TRUE(sync.isLastColumnStretched());
    EXPECT_EQ(reg.getColumn(3).width, 300);
    EXPECT_EQ(changes, 1);

    sync.onEraseBackground();
    sync.stretchLastColumn();
    EXPECT_EQ(reg.getColumn(3).width, 300);
    EXPECT_EQ(changes, 1); //idempotent

    panes.normal.clientWidth = 90;
    sync.onEraseBackground();
    EXPECT_EQ(reg.getColumn(3).width, reg.getColumn(3).minWidth);
}


TEST_F(PaneSyncTest, StretchFollowsDisplayOrder)
{
    panes.normal.clientWidth = 400;
    reg.moveInDisplayOrder(PaneId::normal, 1, 0); //d b

    sync.stretchLastColumn();
    EXPECT_EQ(reg.getColumn(1).width, 300);
    EXPECT_EQ(reg.getColumn(3).width, 100);
}


TEST_F(PaneSyncTest, StretchDisabledKeepsWidths)
{
    panes.normal.clientWidth = 400;
    sync.onEraseBackground();

    EXPECT_FALSE(sync.isLastColumnStretched());
    EXPECT_EQ(reg.getColumn(3).width, 100);
}
