// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef PANE_H_2207914568346619025
#define PANE_H_2207914568346619025

#include <memory>
#include <vector>
#include <wx/scrolwin.h>
#include <wx/bitmap.h>
#include "data_bridge.h"


//one virtual-mode table region: a column header above a row area, rows resolved on demand through the DataBridge
namespace frost
{
//------------------------ events ------------------------------------------------
struct PaneRowEvent : public wxCommandEvent
{
    PaneRowEvent(wxEventType et, ptrdiff_t row) : wxCommandEvent(et), row_(row) {}
    PaneRowEvent* Clone() const override { return new PaneRowEvent(*this); }

    const ptrdiff_t row_; //>= rowCount: empty space below the last row
};

struct PaneItemStateEvent : public wxCommandEvent
{
    PaneItemStateEvent(ptrdiff_t row, bool selectedBefore, bool selectedNow);
    PaneItemStateEvent* Clone() const override { return new PaneItemStateEvent(*this); }

    const ptrdiff_t row_; //-1: all rows
    const bool selectedBefore_;
    const bool selectedNow_;
};

struct PaneColumnEvent : public wxCommandEvent
{
    PaneColumnEvent(wxEventType et, size_t col, int width, size_t posFrom, size_t posTo) :
        wxCommandEvent(et), col_(col), width_(width), posFrom_(posFrom), posTo_(posTo) {}
    PaneColumnEvent* Clone() const override { return new PaneColumnEvent(*this); }

    const size_t col_; //logical index
    const int width_;
    const size_t posFrom_; //display positions for column moves
    const size_t posTo_;   //
};

struct PaneMouseEvent : public wxCommandEvent
{
    PaneMouseEvent(wxEventType et, int value, int wheelDelta = 0) : wxCommandEvent(et), value_(value), wheelDelta_(wheelDelta) {}
    PaneMouseEvent* Clone() const override { return new PaneMouseEvent(*this); }

    const int value_; //scroll: rows; move: y; wheel: rotation
    const int wheelDelta_;
};

wxDECLARE_EVENT(EVENT_PANE_MOUSE_DOWN,      PaneRowEvent);
wxDECLARE_EVENT(EVENT_PANE_ROW_ACTIVATED,   PaneRowEvent);
wxDECLARE_EVENT(EVENT_PANE_CHECK_CLICK,     PaneRowEvent);
wxDECLARE_EVENT(EVENT_PANE_TOGGLE_KEY,      PaneRowEvent);
wxDECLARE_EVENT(EVENT_PANE_DOUBLE_CLICK,    PaneRowEvent);
wxDECLARE_EVENT(EVENT_PANE_ITEM_STATE,      PaneItemStateEvent);
wxDECLARE_EVENT(EVENT_PANE_COL_CLICK,       PaneColumnEvent);
wxDECLARE_EVENT(EVENT_PANE_COL_RESIZE,      PaneColumnEvent);
wxDECLARE_EVENT(EVENT_PANE_COL_MOVE,        PaneColumnEvent);
wxDECLARE_EVENT(EVENT_PANE_SCROLLED,        PaneMouseEvent);
wxDECLARE_EVENT(EVENT_PANE_MOUSE_MOVE,      PaneMouseEvent);
wxDECLARE_EVENT(EVENT_PANE_MOUSE_LEAVE,     PaneMouseEvent);
wxDECLARE_EVENT(EVENT_PANE_MOUSE_WHEEL,     PaneMouseEvent); //not processed by a handler: the pane scrolls itself
wxDECLARE_EVENT(EVENT_PANE_FOCUS,           wxCommandEvent);
wxDECLARE_EVENT(EVENT_PANE_PAINT_BEGIN,     wxCommandEvent);

//--------------------------------------------------------------------------------

//wxWidgets image handle for models and stylers
class WxImageSource : public ImageSource
{
public:
    explicit WxImageSource(const wxBitmap& bmp) : bmp_(bmp) {}
    const wxBitmap& getBitmap() const { return bmp_; }

private:
    const wxBitmap bmp_;
};


class WxCellPainter : public CellPainter
{
public:
    virtual void paint(wxDC& dc, const wxRect& rect, const CellStyle& style, bool selected) = 0;
};


//images shared by both panes
class BitmapList : public ImageList
{
public:
    explicit BitmapList(int iconSize) : iconSize_(iconSize) {}

    int addImage(const ImageRef& img) override; //return -1 if image is not available
    const wxBitmap* getBitmap(int index) const;
    int getIconSize() const { return iconSize_; }

private:
    const int iconSize_;
    std::vector<wxBitmap> bitmaps_;
};


class Pane : public wxScrolledWindow, public NativePane
{
public:
    Pane(wxWindow* parent, PaneId paneId, const ColumnRegistry& columns);

    PaneId getPaneId() const { return paneId_; }
    void setDataBridge(DataBridge* bridge) { bridge_ = bridge; }

    void setRowHeight(int height);
    void setHeaderHidden(bool hidden);
    bool isHeaderHidden() const { return headerHidden_; }
    void setCheckBoxes(bool show) { checkBoxes_ = show; Refresh(); }
    bool hasCheckBoxes() const { return checkBoxes_; }

    void allowColumnMove  (bool value) { allowColumnMove_   = value; }
    void allowColumnResize(bool value) { allowColumnResize_ = value; }

    void onColumnsChanged(); //registry changed: update virtual size and repaint

    //NativePane
    int  getRowHeight() const override { return rowHeight_; }
    int  getHScrollBarHeight() const override;
    int  getClientWidth() const override;
    int  getRowsPerPage() const override;
    void setBounds(const PaneRect& rect) override;

    void scrollByPixels(int dy) override;
    void forwardMouseMove(int y) override;
    void forwardMouseLeave() override;
    void forwardMouseWheel(int rotation, int wheelDelta) override;
    void setFocus() override;
    bool hasFocus() const override;

    void setRowCount(size_t rowCount) override;
    void setMultiSelection(bool multi) override { multiSelection_ = multi; }
    void setItemState(int row, bool focused, bool selected) override; //throw NativeError
    void ensureVisible(size_t row) override; //throw NativeError
    std::vector<size_t> getSelectedRows() const override;

    void redrawRow(size_t row) override;
    void redrawAll() override { Refresh(); }
    void setSortIndicator(int visualCol, SortOrder order) override;
    void suspendRedraw() override { Freeze(); }
    void resumeRedraw () override { Thaw(); }

    size_t getRowCount() const { return selected_.size(); }
    bool isSelected(size_t row) const { return row < selected_.size() && selected_[row] != 0; }

private:
    Pane           (const Pane&) = delete;
    Pane& operator=(const Pane&) = delete;

    class SubWindow;
    class HeaderWin;
    class BodyWin;

    struct PaneColumn
    {
        size_t col = 0; //logical index
        int width = 0;
    };
    std::vector<PaneColumn> getPaneColumns() const; //display order
    int getColumnsWidth() const;

    wxSize GetSizeAvailableForScrollTarget(const wxSize& size) override;
    void updateWindowSizes();
    void scrollDelta(int deltaRows);
    ptrdiff_t getRowAtWinPos(int posY) const; //return -1 for invalid position, >= rowCount if out of range
    std::pair<ptrdiff_t, ptrdiff_t> getVisibleRows(const wxRect& clientRect) const; //[begin, end)
    int getHeaderHeight() const;

    //user interaction: update own state and report it
    void selectRowExclusively(size_t row);
    void setSelected(size_t row, bool selected);
    void clearSelection();
    void setCursor(size_t row);
    void selectRange(size_t rowFrom, size_t rowTo); //reported as a single state change of "rowTo"
    void setHoverRow(ptrdiff_t row);

    void onKeyDown(wxKeyEvent& event);

    bool sendEvent(wxEvent&& event) { return GetEventHandler()->ProcessEvent(event); } //"true" if processed and not skipped

    const PaneId paneId_;
    const ColumnRegistry& columns_;
    DataBridge* bridge_ = nullptr;

    HeaderWin* headerWin_ = nullptr;
    BodyWin*   bodyWin_   = nullptr;

    int rowHeight_ = 0;
    bool headerHidden_ = false;
    bool checkBoxes_ = false;
    bool multiSelection_ = false;
    bool allowColumnMove_   = true;
    bool allowColumnResize_ = true;

    std::vector<char> selected_; //one entry per row; bool is not a container
    ptrdiff_t focusRow_  = -1;
    size_t anchorRow_ = 0;
    ptrdiff_t hoverRow_  = -1;

    int sortVisualCol_ = -1;
    SortOrder sortOrder_ = SortOrder::ascending;

    int mouseRotateRemainder_ = 0;
};
}

#endif //PANE_H_2207914568346619025
