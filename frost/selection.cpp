// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "selection.h"
#include <algorithm>
#include <zen/scope_guard.h>

using namespace zen;
using namespace frost;


namespace
{
std::vector<int> toNormalizedSet(std::vector<int> indexes)
{
    std::sort(indexes.begin(), indexes.end());
    indexes.erase(std::unique(indexes.begin(), indexes.end()), indexes.end());
    return indexes;
}
}


void SelectionController::setCurrentIndex(int index) //throw NativeError
{
    if (inSetCurrentIndex_) //nested call through native state propagation
        return;
    inSetCurrentIndex_ = true;
    ZEN_ON_SCOPE_EXIT(inSetCurrentIndex_ = false);

    for (PaneId pane : {PaneId::frozen, PaneId::normal})
    {
        NativePane& np = panes_[pane];

        if (multiSelection_)
            np.setItemState(-1, false, false); //throw NativeError

        np.setItemState(index, index >= 0, index >= 0); //throw NativeError; index == -1 clears all rows
    }

    if (index >= 0)
        for (PaneId pane : {PaneId::frozen, PaneId::normal})
        {
            //a single request is occasionally ignored by the native control
            panes_[pane].ensureVisible(index); //throw NativeError
            panes_[pane].ensureVisible(index); //
        }

    updateCurrentIndex(index);

    if (multiSelection_)
        reconcileFromNative(PaneId::normal); //throw NativeError
    else
        selectedIndexes_ = index >= 0 ? std::vector<int> {index} : std::vector<int>();
}


void SelectionController::updateCurrentIndex(int index)
{
    currentIndex_ = index;

    if (index == -1 || delayMs_ == 0)
    {
        scheduler_.cancel(NotificationKind::currentIndex);
        publishCurrentIndex();
    }
    else
    {
        delayedCurrentIndexCanceled_ = false;
        scheduler_.schedule(NotificationKind::currentIndex, delayMs_); //supersedes pending timer
    }
}


void SelectionController::setSelectedIndexes(const std::vector<int>& indexes) //throw NativeError
{
    if (!multiSelection_) //selection mirrors the current row: last index wins
    {
        const std::vector<int> selectedOld = selectedIndexes_;
        setCurrentIndex(indexes.empty() ? -1 : indexes.back()); //throw NativeError

        if (selectedIndexes_ != selectedOld)
            publishSelection();
        return;
    }

    inSetSelectedIndexes_ = true;
    ZEN_ON_SCOPE_EXIT(inSetSelectedIndexes_ = false);

    applySelection(indexes); //throw NativeError

    selectedIndexes_ = indexes; //no sorting, no de-duplication: callers see their own order
    publishSelection();
}


void SelectionController::applySelection(const std::vector<int>& indexes) //throw NativeError
{
    for (PaneId pane : {PaneId::frozen, PaneId::normal})
    {
        NativePane& np = panes_[pane];
        np.setItemState(-1, false, false); //throw NativeError

        for (const int row : indexes)
            np.setItemState(row, true, true); //throw NativeError
    }
}


void SelectionController::reconcileFromNative(PaneId source) //throw NativeError
{
    std::vector<int> indexes;
    for (const size_t row : panes_[source].getSelectedRows())
        indexes.push_back(static_cast<int>(row));

    NativePane& other = panes_[otherPane(source)];
    other.setItemState(-1, false, false); //throw NativeError
    for (const int row : indexes)
        other.setItemState(row, row == currentIndex_, true); //throw NativeError

    if (toNormalizedSet(indexes) != toNormalizedSet(selectedIndexes_))
    {
        selectedIndexes_ = std::move(indexes); //native enumeration order
        publishSelection();
    }
}


void SelectionController::setMultiSelection(bool multi)
{
    multiSelection_ = multi;
    panes_.frozen().setMultiSelection(multi);
    panes_.normal().setMultiSelection(multi);
}


void SelectionController::setItemStateChangedDelay(int delayMs)
{
    delayMs_ = std::max(delayMs, 0);
}


void SelectionController::onNativeItemStateChanged(PaneId source, int row, bool selectedBefore, bool selectedNow) //throw NativeError
{
    if (row == -1 && !publishNextSelClear_)
        return;
    publishNextSelClear_ = false;

    if (row >= 0 && selectedNow && !selectedBefore)
    {
        if (multiSelection_)
        {
            panes_[otherPane(source)].setItemState(row, true, true); //throw NativeError
            updateCurrentIndex(row);
        }
        else
            setCurrentIndex(row); //throw NativeError
    }

    if (selectedNow != selectedBefore)
        if (!inSetSelectedIndexes_ && multiSelection_)
            reconcileFromNative(source); //throw NativeError
}


void SelectionController::onItemActivated(int row) //throw NativeError
{
    if (delayMs_ > 0)
    {
        publishCurrentIndex(); //flush pending publication
        delayedCurrentIndexCanceled_ = true;
    }

    if (row != currentIndex_)
    {
        setCurrentIndex(row); //throw NativeError
        publishCurrentIndex();
    }

    if (onActivated)
        onActivated();
}


void SelectionController::onDoubleClick()
{
    if (delayMs_ > 0 && currentIndex_ != lastPublishedIndex_)
        publishCurrentIndex();
}


void SelectionController::onTimer(NotificationKind kind)
{
    switch (kind)
    {
        case NotificationKind::currentIndex:
            if (!delayedCurrentIndexCanceled_)
                publishCurrentIndex();
            break;

        case NotificationKind::selection:
            if (onSelectedIndexesChanged)
                onSelectedIndexesChanged();
            break;
    }
}


void SelectionController::publishCurrentIndex()
{
    if (currentIndex_ == lastPublishedIndex_)
        return;
    lastPublishedIndex_ = currentIndex_;

    if (onCurrentIndexChanged)
        onCurrentIndexChanged();
}


void SelectionController::publishSelection()
{
    if (delayMs_ > 0)
        scheduler_.schedule(NotificationKind::selection, delayMs_);
    else if (onSelectedIndexesChanged)
        onSelectedIndexesChanged();
}


void SelectionController::detachListeners()
{
    scheduler_.cancel(NotificationKind::currentIndex);
    scheduler_.cancel(NotificationKind::selection);

    onCurrentIndexChanged    = nullptr;
    onSelectedIndexesChanged = nullptr;
    onActivated              = nullptr;
}


void SelectionController::onRowsReset() //throw NativeError
{
    setCurrentIndex(-1); //throw NativeError
}


void SelectionController::onRowsInserted(size_t rowFrom, size_t rowTo) //throw NativeError
{
    const int from  = static_cast<int>(rowFrom);
    const int count = static_cast<int>(rowTo - rowFrom + 1);

    std::vector<int> remapped;
    for (const int row : selectedIndexes_)
        remapped.push_back(row >= from ? row + count : row);

    const int i = currentIndex_;
    remapRows(std::move(remapped), i >= from ? i + count : i); //throw NativeError
}


void SelectionController::onRowsRemoved(size_t rowFrom, size_t rowTo) //throw NativeError
{
    const int from  = static_cast<int>(rowFrom);
    const int to    = static_cast<int>(rowTo);
    const int count = to - from + 1;

    std::vector<int> remapped;
    for (const int row : selectedIndexes_)
        if (row < from)
            remapped.push_back(row);
        else if (row > to)
            remapped.push_back(row - count);

    const int i = currentIndex_;
    int index = i;

    if (from <= i && i <= to)
        index = -1;
    else if (from < i)
        index -= count;

    remapRows(std::move(remapped), index); //throw NativeError
}


void SelectionController::remapRows(std::vector<int> selected, int index) //throw NativeError
{
    if (!multiSelection_)
    {
        if (index != currentIndex_)
            setCurrentIndex(index); //throw NativeError
        return;
    }

    inSetSelectedIndexes_ = true;
    ZEN_ON_SCOPE_EXIT(inSetSelectedIndexes_ = false);

    //native focus stays on the current row only, even if other selected rows shifted
    for (PaneId pane : {PaneId::frozen, PaneId::normal})
    {
        NativePane& np = panes_[pane];
        np.setItemState(-1, false, false); //throw NativeError

        for (const int row : selected)
            np.setItemState(row, false, true); //throw NativeError

        if (index >= 0)
            np.setItemState(index, true, std::find(selected.begin(), selected.end(), index) != selected.end()); //throw NativeError
    }

    if (selected != selectedIndexes_)
    {
        selectedIndexes_ = std::move(selected);
        publishSelection();
    }

    if (index != currentIndex_)
        updateCurrentIndex(index);
}
