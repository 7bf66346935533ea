// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef SELECTION_H_3390716228541097162
#define SELECTION_H_3390716228541097162

#include <functional>
#include "native_pane.h"


namespace frost
{
/*  Current item and selected rows of both panes, kept in sync with the native row state.
    Publication of "current index changed" and "selection changed" may be deferred by a debounce delay:

    native change  -> state updated -> timer (re-)scheduled -> timer fires -> published unless canceled
    item activated -> pending publication flushed, timer marked canceled                                  */
class SelectionController
{
public:
    SelectionController(PanePair& panes, DebounceScheduler& scheduler) : panes_(panes), scheduler_(scheduler) {}

    int getCurrentIndex() const { return currentIndex_; }
    void setCurrentIndex(int index); //throw NativeError

    const std::vector<int>& getSelectedIndexes() const { return selectedIndexes_; } //in the order they were set
    void setSelectedIndexes(const std::vector<int>& indexes); //throw NativeError

    //re-read the selected rows of "source" pane, mirror them to the other pane and publish if changed
    void reconcileFromNative(PaneId source = PaneId::normal); //throw NativeError

    bool isMultiSelection() const { return multiSelection_; }
    void setMultiSelection(bool multi);

    int  getItemStateChangedDelay() const { return delayMs_; } //milliseconds
    void setItemStateChangedDelay(int delayMs);

    //native notifications
    void onNativeItemStateChanged(PaneId source, int row, bool selectedBefore, bool selectedNow); //throw NativeError; row == -1: all rows
    void onItemActivated(int row); //throw NativeError
    void onDoubleClick();
    void publishNextSelectionClear() { publishNextSelClear_ = true; } //an "all rows cleared" notification is normally ignored
    void onTimer(NotificationKind kind);

    //model notifications
    void onRowsReset(); //throw NativeError
    void onRowsInserted(size_t rowFrom, size_t rowTo); //throw NativeError
    void onRowsRemoved (size_t rowFrom, size_t rowTo); //

    //events
    std::function<void()> onCurrentIndexChanged;
    std::function<void()> onSelectedIndexesChanged;
    std::function<void()> onActivated;

    void detachListeners();

private:
    SelectionController           (const SelectionController&) = delete;
    SelectionController& operator=(const SelectionController&) = delete;

    void applySelection(const std::vector<int>& indexes); //throw NativeError
    void updateCurrentIndex(int index);
    void remapRows(std::vector<int> selected, int index); //throw NativeError; after rows were inserted or removed
    void publishCurrentIndex();
    void publishSelection();

    PanePair& panes_;
    DebounceScheduler& scheduler_;

    int currentIndex_ = -1;
    int lastPublishedIndex_ = -1;
    std::vector<int> selectedIndexes_;

    bool multiSelection_ = false;
    int delayMs_ = 0;
    bool delayedCurrentIndexCanceled_ = false;
    bool publishNextSelClear_ = false;

    bool inSetCurrentIndex_    = false;
    bool inSetSelectedIndexes_ = false;
};
}

#endif //SELECTION_H_3390716228541097162
