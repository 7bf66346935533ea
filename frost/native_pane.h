// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef NATIVE_PANE_H_8350146299127463056
#define NATIVE_PANE_H_8350146299127463056

#include <vector>
#include "column_registry.h"
#include "table_model.h"


//narrow interfaces the core uses to drive the two rendered panes and the debounce timers
namespace frost
{
struct PaneRect
{
    int x = 0;
    int y = 0;
    int width  = 0;
    int height = 0;

    bool operator==(const PaneRect&) const = default;
};


class NativePane
{
public:
    virtual ~NativePane() {}

    //geometry
    virtual int  getRowHeight() const = 0;
    virtual int  getHScrollBarHeight() const = 0; //0 if no horizontal scroll bar is shown
    virtual int  getClientWidth() const = 0;      //excluding vertical scroll bar
    virtual int  getRowsPerPage() const = 0;      //fully visible rows
    virtual void setBounds(const PaneRect& rect) = 0;

    //scrolling and input forwarding
    virtual void scrollByPixels(int dy) = 0;
    virtual void forwardMouseMove(int y) = 0; //x is always 0
    virtual void forwardMouseLeave() = 0;
    virtual void forwardMouseWheel(int rotation, int wheelDelta) = 0;
    virtual void setFocus() = 0;
    virtual bool hasFocus() const = 0;

    //row state
    virtual void setRowCount(size_t rowCount) = 0;
    virtual void setMultiSelection(bool multi) = 0; //single selection: selecting a row deselects all others
    virtual void setItemState(int row, bool focused, bool selected) = 0; //throw NativeError; row == -1: all rows
    virtual void ensureVisible(size_t row) = 0;                           //throw NativeError
    virtual std::vector<size_t> getSelectedRows() const = 0;             //native enumeration order

    //painting
    virtual void redrawRow(size_t row) = 0;
    virtual void redrawAll() = 0;
    virtual void setSortIndicator(int visualCol, SortOrder order) = 0; //visualCol == -1: no indicator
    virtual void suspendRedraw() = 0;
    virtual void resumeRedraw() = 0;
};


class PanePair
{
public:
    PanePair(NativePane& frozen, NativePane& normal) : frozen_(frozen), normal_(normal) {}

    NativePane& operator[](PaneId pane) { return pane == PaneId::frozen ? frozen_ : normal_; }
    const NativePane& operator[](PaneId pane) const { return pane == PaneId::frozen ? frozen_ : normal_; }

    NativePane& frozen() { return frozen_; }
    NativePane& normal() { return normal_; }

private:
    NativePane& frozen_;
    NativePane& normal_;
};


//suspend painting of both panes for the current scope
class RedrawSuspension
{
public:
    explicit RedrawSuspension(PanePair& panes) : panes_(panes)
    {
        panes_.frozen().suspendRedraw();
        panes_.normal().suspendRedraw();
    }
    ~RedrawSuspension()
    {
        panes_.normal().resumeRedraw();
        panes_.frozen().resumeRedraw();
    }

private:
    RedrawSuspension           (const RedrawSuspension&) = delete;
    RedrawSuspension& operator=(const RedrawSuspension&) = delete;

    PanePair& panes_;
};


enum class NotificationKind
{
    currentIndex,
    selection,
};


//one-shot timers: at most one outstanding per kind; scheduling again supersedes the pending one
class DebounceScheduler
{
public:
    virtual ~DebounceScheduler() {}

    virtual void schedule(NotificationKind kind, int delayMs) = 0;
    virtual void cancel  (NotificationKind kind) = 0;
};
}

#endif //NATIVE_PANE_H_8350146299127463056
