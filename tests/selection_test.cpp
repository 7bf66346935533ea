// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include <frost/selection.h>
#include "fakes.h"

using namespace frost;
using namespace frost_test;


class SelectionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        panes.setRowCount(10);

        sel.onCurrentIndexChanged    = [this] { ++currentPublished; };
        sel.onSelectedIndexesChanged = [this] { ++selectionPublished; };
        sel.onActivated              = [this] { ++activated; };
    }

    void setRowCount(size_t rowCount) { panes.setRowCount(rowCount); }

    //ctrl + click: the native pane adds the row to its selection and focuses it
    void ctrlClick(int row)
    {
        panes.normal.setItemState(row, true, true);
        sel.onNativeItemStateChanged(PaneId::normal, row, false, true);
    }

    void expectFocusOnCurrentRow()
    {
        EXPECT_EQ(panes.frozen.focusRow, sel.getCurrentIndex());
        EXPECT_EQ(panes.normal.focusRow, sel.getCurrentIndex());
    }

    FakePanes panes;
    ManualScheduler sched;
    SelectionController sel{panes.pair, sched};

    int currentPublished   = 0;
    int selectionPublished = 0;
    int activated          = 0;
};


TEST_F(SelectionTest, CurrentIndexIsAppliedToBothPanes)
{
    sel.setCurrentIndex(3);

    EXPECT_EQ(sel.getCurrentIndex(), 3);
    EXPECT_EQ(currentPublished, 1);

    for (FakePane* pane : {&panes.frozen, &panes.normal})
    {
        EXPECT_TRUE(pane->selected[3]);
        EXPECT_EQ(pane->focusRow, 3);
        EXPECT_EQ(pane->ensureVisibleRows, (std::vector<size_t> {3, 3})); //requested twice
    }
    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {3}));
}


TEST_F(SelectionTest, ClearingTwiceIsIdempotent)
{
    sel.setCurrentIndex(2);
    sel.setCurrentIndex(-1);
    EXPECT_EQ(currentPublished, 2);

    sel.setCurrentIndex(-1);
    EXPECT_EQ(currentPublished, 2);
    EXPECT_EQ(sel.getCurrentIndex(), -1);
    EXPECT_EQ(panes.normal.getSelectedRows(), std::vector<size_t>());
}


TEST_F(SelectionTest, RapidChangesArePublishedOnce)
{
    sel.setItemStateChangedDelay(200);

    sel.setCurrentIndex(1);
    sel.setCurrentIndex(2);
    sel.setCurrentIndex(3);

    EXPECT_EQ(currentPublished, 0);
    ASSERT_TRUE(sched.isPending(NotificationKind::currentIndex));
    EXPECT_EQ(sched.pending[NotificationKind::currentIndex], 200);

    sched.fire(NotificationKind::currentIndex, sel);
    EXPECT_EQ(currentPublished, 1);
    EXPECT_EQ(sel.getCurrentIndex(), 3);

    sched.fire(NotificationKind::currentIndex, sel); //nothing pending
    EXPECT_EQ(currentPublished, 1);
}


TEST_F(SelectionTest, ClearingIsNeverDelayed)
{
    sel.setItemStateChangedDelay(200);
    sel.setCurrentIndex(4);
    sel.setCurrentIndex(-1);

    EXPECT_FALSE(sched.isPending(NotificationKind::currentIndex));
    EXPECT_EQ(currentPublished, 0); //4 was never published, -1 equals the last published index
}


TEST_F(SelectionTest, ActivationFlushesPendingPublication)
{
    sel.setItemStateChangedDelay(200);
    sel.setCurrentIndex(4);

    sel.onItemActivated(4);
    EXPECT_EQ(currentPublished, 1);
    EXPECT_EQ(activated, 1);

    sched.fire(NotificationKind::currentIndex, sel); //canceled
    EXPECT_EQ(currentPublished, 1);
}


TEST_F(SelectionTest, ActivatingAnotherRowMovesCurrentIndex)
{
    sel.setCurrentIndex(1);
    sel.onItemActivated(6);

    EXPECT_EQ(sel.getCurrentIndex(), 6);
    EXPECT_EQ(currentPublished, 2);
    EXPECT_EQ(activated, 1);
}


TEST_F(SelectionTest, InsertAfterCurrentKeepsIndex)
{
    sel.setCurrentIndex(2);
    setRowCount(13);
    sel.onRowsInserted(3, 5);

    EXPECT_EQ(sel.getCurrentIndex(), 2);
    EXPECT_EQ(currentPublished, 1);
}


TEST_F(SelectionTest, InsertBeforeCurrentShiftsIndex)
{
    sel.setCurrentIndex(2);
    setRowCount(12);
    sel.onRowsInserted(0, 1);

    EXPECT_EQ(sel.getCurrentIndex(), 4);
    EXPECT_TRUE(panes.normal.selected[4]);
    EXPECT_EQ(currentPublished, 2);
}


TEST_F(SelectionTest, RemovingCurrentClearsIndex)
{
    sel.setCurrentIndex(2);
    setRowCount(7);
    sel.onRowsRemoved(1, 3);

    EXPECT_EQ(sel.getCurrentIndex(), -1);
}


TEST_F(SelectionTest, RemovingBeforeCurrentShiftsIndex)
{
    sel.setCurrentIndex(5);
    setRowCount(8);
    sel.onRowsRemoved(0, 1);

    EXPECT_EQ(sel.getCurrentIndex(), 3);
    EXPECT_TRUE(panes.frozen.selected[3]);
}


TEST_F(SelectionTest, OutOfRangeIndexIsNativeError)
{
    EXPECT_THROW(sel.setCurrentIndex(50), NativeError);
}


TEST_F(SelectionTest, SelectedIndexesKeepCallerOrder)
{
    sel.setMultiSelection(true);
    EXPECT_TRUE(panes.normal.multiSelection);

    sel.setSelectedIndexes({5, 1, 5});

    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {5, 1, 5}));
    EXPECT_EQ(panes.frozen.getSelectedRows(), (std::vector<size_t> {1, 5}));
    EXPECT_EQ(panes.normal.getSelectedRows(), (std::vector<size_t> {1, 5}));
    EXPECT_EQ(selectionPublished, 1);
}


TEST_F(SelectionTest, ReconcilePublishesNetChangesOnly)
{
    sel.setMultiSelection(true);
    sel.setSelectedIndexes({5, 1});
    ASSERT_EQ(selectionPublished, 1);

    sel.reconcileFromNative(); //same set, different order
    EXPECT_EQ(selectionPublished, 1);

    panes.normal.userSelects(7);
    sel.onNativeItemStateChanged(PaneId::normal, 7, false, true);

    EXPECT_EQ(selectionPublished, 2);
    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {1, 5, 7}));
    EXPECT_EQ(sel.getCurrentIndex(), 7);
    EXPECT_TRUE(panes.frozen.selected[7]); //mirrored into the other pane
}


TEST_F(SelectionTest, ClearAllIsIgnoredUnlessRequested)
{
    sel.setMultiSelection(true);
    sel.setSelectedIndexes({2});

    std::fill(panes.normal.selected.begin(), panes.normal.selected.end(), false);
    sel.onNativeItemStateChanged(PaneId::normal, -1, true, false);
    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {2}));

    sel.publishNextSelectionClear();
    sel.onNativeItemStateChanged(PaneId::normal, -1, true, false);
    EXPECT_EQ(sel.getSelectedIndexes(), std::vector<int>());
    EXPECT_EQ(selectionPublished, 2);
}


TEST_F(SelectionTest, MultiSelectionIsRemappedOnInsert)
{
    sel.setMultiSelection(true);
    sel.setCurrentIndex(4);
    sel.setSelectedIndexes({1, 4});

    setRowCount(12);
    sel.onRowsInserted(0, 1);

    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {3, 6}));
    EXPECT_EQ(sel.getCurrentIndex(), 6);
    EXPECT_EQ(panes.normal.getSelectedRows(), (std::vector<size_t> {3, 6}));
    EXPECT_EQ(panes.normal.focusRow, 6);
}


TEST_F(SelectionTest, FocusStaysOnCurrentRowWhenSelectionShifts)
{
    sel.setMultiSelection(true);
    ctrlClick(4);
    ctrlClick(1);
    ASSERT_EQ(sel.getCurrentIndex(), 1);
    const int currentPublishedOld = currentPublished;

    setRowCount(11);
    sel.onRowsInserted(3, 3);

    EXPECT_EQ(sel.getCurrentIndex(), 1);
    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {1, 5}));
    EXPECT_EQ(panes.normal.getSelectedRows(), (std::vector<size_t> {1, 5}));
    EXPECT_EQ(panes.frozen.getSelectedRows(), (std::vector<size_t> {1, 5}));
    expectFocusOnCurrentRow();
    EXPECT_EQ(currentPublished, currentPublishedOld);
}


TEST_F(SelectionTest, MultiSelectionIsRemappedOnRemove)
{
    sel.setMultiSelection(true);
    ctrlClick(2);
    ctrlClick(5);
    ctrlClick(8);
    ctrlClick(0);
    ASSERT_EQ(sel.getSelectedIndexes(), (std::vector<int> {0, 2, 5, 8}));
    const int selectionPublishedOld = selectionPublished;

    setRowCount(8);
    sel.onRowsRemoved(4, 5); //drops 5, shifts 8

    EXPECT_EQ(sel.getCurrentIndex(), 0);
    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {0, 2, 6}));
    EXPECT_EQ(panes.normal.getSelectedRows(), (std::vector<size_t> {0, 2, 6}));
    EXPECT_EQ(panes.frozen.getSelectedRows(), (std::vector<size_t> {0, 2, 6}));
    expectFocusOnCurrentRow();
    EXPECT_EQ(selectionPublished, selectionPublishedOld + 1);
}


TEST_F(SelectionTest, RemovingCurrentRowInMultiSelection)
{
    sel.setMultiSelection(true);
    ctrlClick(2);
    ctrlClick(7);
    ctrlClick(6);
    ASSERT_EQ(sel.getCurrentIndex(), 6);
    const int currentPublishedOld = currentPublished;

    setRowCount(9);
    sel.onRowsRemoved(6, 6);

    EXPECT_EQ(sel.getCurrentIndex(), -1);
    EXPECT_EQ(currentPublished, currentPublishedOld + 1); //clearing is never delayed
    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {2, 6}));
    EXPECT_EQ(panes.normal.getSelectedRows(), (std::vector<size_t> {2, 6}));
    expectFocusOnCurrentRow();
}


TEST_F(SelectionTest, SingleSelectionMirrorsCurrentIndex)
{
    sel.setSelectedIndexes({1, 4});

    EXPECT_EQ(sel.getCurrentIndex(), 4);
    EXPECT_EQ(sel.getSelectedIndexes(), (std::vector<int> {4}));
    EXPECT_EQ(panes.normal.getSelectedRows(), (std::vector<size_t> {4}));
    EXPECT_EQ(panes.frozen.getSelectedRows(), (std::vector<size_t> {4}));
    expectFocusOnCurrentRow();
    EXPECT_EQ(selectionPublished, 1);

    sel.setSelectedIndexes({});
    EXPECT_EQ(sel.getCurrentIndex(), -1);
    EXPECT_TRUE(sel.getSelectedIndexes().empty());
    EXPECT_TRUE(panes.normal.getSelectedRows().empty());
    EXPECT_EQ(selectionPublished, 2);
}


TEST_F(SelectionTest, DetachedListenersAreNotNotified)
{
    sel.setItemStateChangedDelay(100);
    sel.setCurrentIndex(3);
    ASSERT_TRUE(sched.isPending(NotificationKind::currentIndex));

    sel.detachListeners();
    EXPECT_FALSE(sched.isPending(NotificationKind::currentIndex));

    sel.setCurrentIndex(-1);
    sel.onItemActivated(2);

    EXPECT_EQ(currentPublished, 0);
    EXPECT_EQ(activated, 0);
    EXPECT_EQ(sel.getCurrentIndex(), 2);
}


TEST_F(SelectionTest, SelectionPublicationIsDebounced)
{
    sel.setMultiSelection(true);
    sel.setItemStateChangedDelay(100);

    sel.setSelectedIndexes({1});
    sel.setSelectedIndexes({1, 2});
    EXPECT_EQ(selectionPublished, 0);

    sched.fire(NotificationKind::selection, sel);
    EXPECT_EQ(selectionPublished, 1);
}
