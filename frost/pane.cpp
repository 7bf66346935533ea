// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "pane.h"
#include <algorithm>
#include <wx/settings.h>
#include <wx/renderer.h>
#include <wx/image.h>
#include <wx/log.h>
#include <zen/basic_math.h>
#include <zen/extra_log.h>
#include <zen/i18n.h>
#include "dc.h"
#include "table_error.h"

using namespace zen;
using namespace frost;


namespace frost
{
wxDEFINE_EVENT(EVENT_PANE_MOUSE_DOWN,    PaneRowEvent);
wxDEFINE_EVENT(EVENT_PANE_ROW_ACTIVATED, PaneRowEvent);
wxDEFINE_EVENT(EVENT_PANE_CHECK_CLICK,   PaneRowEvent);
wxDEFINE_EVENT(EVENT_PANE_TOGGLE_KEY,    PaneRowEvent);
wxDEFINE_EVENT(EVENT_PANE_DOUBLE_CLICK,  PaneRowEvent);
wxDEFINE_EVENT(EVENT_PANE_ITEM_STATE,    PaneItemStateEvent);
wxDEFINE_EVENT(EVENT_PANE_COL_CLICK,     PaneColumnEvent);
wxDEFINE_EVENT(EVENT_PANE_COL_RESIZE,    PaneColumnEvent);
wxDEFINE_EVENT(EVENT_PANE_COL_MOVE,      PaneColumnEvent);
wxDEFINE_EVENT(EVENT_PANE_SCROLLED,      PaneMouseEvent);
wxDEFINE_EVENT(EVENT_PANE_MOUSE_MOVE,    PaneMouseEvent);
wxDEFINE_EVENT(EVENT_PANE_MOUSE_LEAVE,   PaneMouseEvent);
wxDEFINE_EVENT(EVENT_PANE_MOUSE_WHEEL,   PaneMouseEvent);
wxDEFINE_EVENT(EVENT_PANE_FOCUS,         wxCommandEvent);
wxDEFINE_EVENT(EVENT_PANE_PAINT_BEGIN,   wxCommandEvent);
}


PaneItemStateEvent::PaneItemStateEvent(ptrdiff_t row, bool selectedBefore, bool selectedNow) :
    wxCommandEvent(EVENT_PANE_ITEM_STATE), row_(row), selectedBefore_(selectedBefore), selectedNow_(selectedNow) {}


namespace
{
//------------------------------ Pane Parameters --------------------------------
inline wxColor getColorSelectionGradientFrom() { return {137, 172, 255}; }
inline wxColor getColorSelectionGradientTo  () { return {225, 234, 255}; }
inline wxColor getColorHover() { return {235, 241, 255}; }
inline wxColor getColorGridLine() { return wxSystemSettings::GetColour(wxSYS_COLOUR_BTNSHADOW); }
inline wxColor getColorLabelGradientFrom() { return wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW); }
inline wxColor getColorLabelGradientTo  () { return wxSystemSettings::GetColour(wxSYS_COLOUR_BTNFACE); }

const int COLUMN_GAP_LEFT_DIP          =  4;
const int HEADER_BORDER_DIP            =  6; //top + bottom border in addition to label height
const int COLUMN_MOVE_DELAY_DIP        =  5; //unit: [pixel]
const int COLUMN_RESIZE_TOLERANCE_DIP  =  6; //
const int COLUMN_MOVE_MARKER_WIDTH_DIP =  3;
const int SORT_MARKER_SIZE_DIP         =  8;
const int LINES_PER_WHEEL_ROTATION     =  3;


int toWxAlignment(CellAlignment align)
{
    switch (align)
    {
        case CellAlignment::left:
            return wxALIGN_LEFT | wxALIGN_CENTER_VERTICAL;
        case CellAlignment::center:
            return wxALIGN_CENTER_HORIZONTAL | wxALIGN_CENTER_VERTICAL;
        case CellAlignment::right:
            return wxALIGN_RIGHT | wxALIGN_CENTER_VERTICAL;
    }
    return wxALIGN_LEFT | wxALIGN_CENTER_VERTICAL;
}


wxFont toWxFont(const wxFont& base, const FontStyle& fs)
{
    wxFont font = base;
    if (fs.bold)
        font.MakeBold();
    if (fs.italic)
        font.MakeItalic();
    if (fs.sizeDelta != 0)
        font.SetPointSize(std::max(1, font.GetPointSize() + fs.sizeDelta));
    return font;
}


class ColumnResizing
{
public:
    ColumnResizing(wxWindow& wnd, size_t col, int startWidth, int clientPosX) :
        wnd_(wnd), col_(col), startWidth_(startWidth), clientPosX_(clientPosX)
    {
        wnd_.CaptureMouse();
    }
    ~ColumnResizing()
    {
        if (wnd_.HasCapture())
            wnd_.ReleaseMouse();
    }

    size_t getColumn    () const { return col_; }
    int    getStartWidth() const { return startWidth_; }
    int    getStartPosX () const { return clientPosX_; }

private:
    wxWindow& wnd_;
    const size_t col_; //logical index
    const int    startWidth_;
    const int    clientPosX_;
};


class ColumnMove
{
public:
    ColumnMove(wxWindow& wnd, size_t posFrom, int clientPosX) :
        wnd_(wnd),
        posFrom_(posFrom),
        posTo_(posFrom),
        clientPosX_(clientPosX) { wnd_.CaptureMouse(); }
    ~ColumnMove() { if (wnd_.HasCapture()) wnd_.ReleaseMouse(); }

    size_t  getPosFrom() const { return posFrom_; }
    size_t& refPosTo() { return posTo_; }
    int     getStartPosX() const { return clientPosX_; }

    bool isRealMove() const { return !singleClick_; }
    void setRealMove() { singleClick_ = false; }

private:
    wxWindow& wnd_;
    const size_t posFrom_; //display positions
    size_t posTo_;         //
    const int clientPosX_;
    bool singleClick_ = true;
};
}

//----------------------------------------------------------------------------------------------------------------

int BitmapList::addImage(const ImageRef& img)
{
    wxBitmap bmp;

    if (const auto src = dynamic_cast<const WxImageSource*>(img.source.get()))
        bmp = src->getBitmap();
    else if (!img.filePath.empty())
    {
        wxLogNull noLog; //a missing file is reported as "no image"
        wxImage wxImg;
        if (wxImg.LoadFile(img.filePath, wxBITMAP_TYPE_ANY))
        {
            if (wxImg.GetWidth() != iconSize_ || wxImg.GetHeight() != iconSize_)
                wxImg.Rescale(iconSize_, iconSize_, wxIMAGE_QUALITY_HIGH);
            bmp = wxBitmap(wxImg);
        }
    }

    if (!bmp.IsOk())
        return -1;

    bitmaps_.push_back(bmp);
    return static_cast<int>(bitmaps_.size()) - 1;
}


const wxBitmap* BitmapList::getBitmap(int index) const
{
    if (0 <= index && index < static_cast<int>(bitmaps_.size()))
        return &bitmaps_[index];
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------
/*             SubWindow
                  /|\
          ________|________
          |               |
      HeaderWin        BodyWin          */

class Pane::SubWindow : public wxWindow
{
public:
    SubWindow(Pane& parent) :
        wxWindow(&parent, wxID_ANY, wxDefaultPosition, wxDefaultSize, wxWANTS_CHARS | wxBORDER_NONE, wxASCII_STR(wxPanelNameStr)),
        parent_(parent)
    {
        Bind(wxEVT_PAINT, [this](wxPaintEvent& event) { onPaintEvent(event); });
        Bind(wxEVT_SIZE,  [this](wxSizeEvent&  event) { Refresh(); event.Skip(); });
        Bind(wxEVT_ERASE_BACKGROUND, [](wxEraseEvent& event) {}); //flicker-free drawing
        SetBackgroundStyle(wxBG_STYLE_PAINT);

        Bind(wxEVT_CHILD_FOCUS, [](wxChildFocusEvent& event) {}); //wxGTK::wxScrolledWindow scrolls to a child getting focus -> prevent!

        Bind(wxEVT_LEFT_DOWN,    [this](wxMouseEvent& event) { onMouseLeftDown  (event); });
        Bind(wxEVT_LEFT_UP,      [this](wxMouseEvent& event) { onMouseLeftUp    (event); });
        Bind(wxEVT_LEFT_DCLICK,  [this](wxMouseEvent& event) { onMouseLeftDouble(event); });
        Bind(wxEVT_MOTION,       [this](wxMouseEvent& event) { onMouseMovement  (event); });
        Bind(wxEVT_LEAVE_WINDOW, [this](wxMouseEvent& event) { onLeaveWindow    (event); });
        Bind(wxEVT_MOUSEWHEEL,   [this](wxMouseEvent& event) { onMouseWheel     (event); });
        Bind(wxEVT_MOUSE_CAPTURE_LOST, [this](wxMouseCaptureLostEvent& event) { onMouseCaptureLost(event); });

        Bind(wxEVT_KEY_DOWN, [this](wxKeyEvent& event)
        {
            if (!parent_.GetEventHandler()->ProcessEvent(event)) //let parent collect all key events
                event.Skip();
        });
    }

    Pane&       refParent()       { return parent_; }
    const Pane& refParent() const { return parent_; }

private:
    virtual void render(wxDC& dc, const wxRect& rect) = 0;
    virtual void onBeforePaint() {}

    virtual void onMouseLeftDown  (wxMouseEvent& event) { event.Skip(); }
    virtual void onMouseLeftUp    (wxMouseEvent& event) { event.Skip(); }
    virtual void onMouseLeftDouble(wxMouseEvent& event) { event.Skip(); }
    virtual void onMouseMovement  (wxMouseEvent& event) { event.Skip(); }
    virtual void onLeaveWindow    (wxMouseEvent& event) { event.Skip(); }
    virtual void onMouseCaptureLost(wxMouseCaptureLostEvent& event) { event.Skip(); }

    void onMouseWheel(wxMouseEvent& event)
    {
        //the table view may redirect the wheel to the pane that owns scrolling
        if (event.GetWheelAxis() == wxMOUSE_WHEEL_VERTICAL)
        {
            if (!parent_.sendEvent(PaneMouseEvent(EVENT_PANE_MOUSE_WHEEL, event.GetWheelRotation(), event.GetWheelDelta())))
                parent_.forwardMouseWheel(event.GetWheelRotation(), event.GetWheelDelta());
        }
        else
            parent_.HandleOnMouseWheel(event);

        event.Skip(false);
    }

    void onPaintEvent(wxPaintEvent& event)
    {
        onBeforePaint();

        BufferedPaintDC dc(*this, doubleBuffer_);

        const wxRegion& updateReg = GetUpdateRegion();
        for (wxRegionIterator it = updateReg; it; ++it)
            render(dc, it.GetRect());
    }

    Pane& parent_;
    std::optional<wxBitmap> doubleBuffer_;
};

//----------------------------------------------------------------------------------------------------------------

class Pane::HeaderWin : public SubWindow
{
public:
    explicit HeaderWin(Pane& parent) : SubWindow(parent),
        labelFont_(GetFont().Bold())
    {
        headerHeight_ = dipToWxsize(2 * HEADER_BORDER_DIP) + labelFont_.GetPixelSize().GetHeight();
    }

    int getHeight() const { return headerHeight_; }

private:
    bool AcceptsFocus() const override { return false; }

    struct ColAction
    {
        bool wantResize = false; //"!wantResize" means "move or single click"
        size_t pos = 0;          //display position
    };

    void render(wxDC& dc, const wxRect& rect) override
    {
        clearArea(dc, rect, wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW));

        dc.SetFont(labelFont_);
        dc.SetTextForeground(wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOWTEXT));

        wxPoint labelAreaTL(refParent().CalcScrolledPosition(wxPoint(0, 0)).x, 0); //client coordinates

        const std::vector<PaneColumn> paneCols = refParent().getPaneColumns();
        for (size_t pos = 0; pos < paneCols.size(); ++pos)
        {
            const int width = paneCols[pos].width;

            if (labelAreaTL.x > rect.GetRight())
                return; //done, rect is fully covered
            if (labelAreaTL.x + width > rect.x)
                drawColumnLabel(dc, wxRect(labelAreaTL, wxSize(width, headerHeight_)), pos, &paneCols[pos]);
            labelAreaTL.x += width;
        }

        //fill gap after columns
        const int clientWidth = GetClientSize().GetWidth();
        if (labelAreaTL.x < clientWidth)
            drawColumnLabel(dc, wxRect(labelAreaTL, wxSize(clientWidth - labelAreaTL.x, headerHeight_)), paneCols.size(), nullptr);
    }

    void drawColumnLabel(wxDC& dc, const wxRect& rect, size_t pos, const PaneColumn* pc)
    {
        const bool highlighted = activeResizing_    ? pc && pc->col == activeResizing_->getColumn() :
                                 activeClickOrMove_ ? pos == activeClickOrMove_->getPosFrom() :
                                 highlightPos_      ? pos == *highlightPos_ :
                                 false;

        RecursiveDcClipper clip(dc, rect);

        if (highlighted)
            dc.GradientFillLinear(rect, getColorLabelGradientFrom(), getColorSelectionGradientFrom(), wxSOUTH);
        else
            dc.GradientFillLinear(rect, getColorLabelGradientFrom(), getColorLabelGradientTo(), wxSOUTH);

        //right + bottom border
        clearArea(dc, wxRect(rect.x + rect.width - dipToWxsize(1), rect.y, dipToWxsize(1), rect.height), getColorGridLine());
        clearArea(dc, wxRect(rect.x, rect.y + rect.height - dipToWxsize(1), rect.width, dipToWxsize(1)), getColorGridLine());

        if (!pc)
            return;

        const Column& column = refParent().columns_.getColumn(pc->col);

        wxRect textRect = rect.Deflate(dipToWxsize(1), dipToWxsize(1));
        textRect.x     += dipToWxsize(COLUMN_GAP_LEFT_DIP);
        textRect.width -= dipToWxsize(COLUMN_GAP_LEFT_DIP);

        if (refParent().sortVisualCol_ >= 0 &&
            refParent().columns_.toVisualIndex(pc->col) == refParent().sortVisualCol_)
        {
            const int markerSize = dipToWxsize(SORT_MARKER_SIZE_DIP);
            textRect.width -= markerSize + dipToWxsize(COLUMN_GAP_LEFT_DIP);

            const int x = rect.x + rect.width - markerSize - dipToWxsize(COLUMN_GAP_LEFT_DIP);
            const int y = rect.y + (rect.height - markerSize / 2) / 2;

            const wxPoint triangleUp  [] = {{x, y + markerSize / 2}, {x + markerSize, y + markerSize / 2}, {x + markerSize / 2, y}};
            const wxPoint triangleDown[] = {{x, y}, {x + markerSize, y}, {x + markerSize / 2, y + markerSize / 2}};

            dc.SetPen(*wxTRANSPARENT_PEN);
            dc.SetBrush(getColorGridLine());
            dc.DrawPolygon(3, refParent().sortOrder_ == SortOrder::ascending ? triangleUp : triangleDown);
        }

        drawTextTruncated(dc, textRect, column.getEffectiveTitle(), toWxAlignment(column.alignment));

        //draw move target location
        if (activeClickOrMove_ && activeClickOrMove_->isRealMove())
        {
            const int markerWidth = dipToWxsize(COLUMN_MOVE_MARKER_WIDTH_DIP);

            if (pos + 1 == activeClickOrMove_->refPosTo()) //handle pos 1, 2, .. up to "at end" position
                dc.GradientFillLinear(wxRect(rect.x + rect.width - markerWidth, rect.y, markerWidth, rect.height), getColorLabelGradientFrom(), *wxBLUE, wxSOUTH);
            else if (pos == activeClickOrMove_->refPosTo() && pos == 0)
                dc.GradientFillLinear(wxRect(rect.GetTopLeft(), wxSize(markerWidth, rect.height)), getColorLabelGradientFrom(), *wxBLUE, wxSOUTH);
        }
    }

    std::optional<ColAction> clientPosToColumnAction(const wxPoint& pos) const
    {
        if (0 <= pos.y && pos.y < headerHeight_)
            if (const int absPosX = refParent().CalcUnscrolledPosition(pos).x;
                absPosX >= 0)
            {
                const int resizeTolerance = refParent().allowColumnResize_ ? dipToWxsize(COLUMN_RESIZE_TOLERANCE_DIP) : 0;
                const std::vector<PaneColumn> paneCols = refParent().getPaneColumns();

                int accuWidth = 0;
                for (size_t colPos = 0; colPos < paneCols.size(); ++colPos)
                {
                    accuWidth += paneCols[colPos].width;
                    if (std::abs(absPosX - accuWidth) < resizeTolerance)
                        return ColAction{true, colPos};
                    else if (absPosX < accuWidth)
                        return ColAction{false, colPos};
                }
            }
        return {};
    }

    size_t clientPosToMoveTargetPos(const wxPoint& pos) const
    {
        const int absPosX = refParent().CalcUnscrolledPosition(pos).x;
        const std::vector<PaneColumn> paneCols = refParent().getPaneColumns();

        int accWidth = 0;
        for (size_t colPos = 0; colPos < paneCols.size(); ++colPos)
        {
            const int width = paneCols[colPos].width;
            accWidth += width;

            if (absPosX < accWidth - width / 2)
                return colPos;
        }
        return paneCols.size();
    }

    void onMouseLeftDown(wxMouseEvent& event) override
    {
        activeResizing_   .reset();
        activeClickOrMove_.reset();

        if (const std::optional<ColAction> action = clientPosToColumnAction(event.GetPosition()))
        {
            const std::vector<PaneColumn> paneCols = refParent().getPaneColumns();

            if (action->wantResize)
                activeResizing_ = std::make_unique<ColumnResizing>(*this, paneCols[action->pos].col, paneCols[action->pos].width, event.GetPosition().x);
            else //a move or single click
                activeClickOrMove_ = std::make_unique<ColumnMove>(*this, action->pos, event.GetPosition().x);
        }
        event.Skip();
    }

    void onMouseLeftUp(wxMouseEvent& event) override
    {
        activeResizing_.reset(); //actual work done by onMouseMovement()

        if (activeClickOrMove_)
        {
            const size_t posFrom = activeClickOrMove_->getPosFrom();
            size_t       posTo   = activeClickOrMove_->refPosTo();
            const bool   realMove = activeClickOrMove_->isRealMove();

            activeClickOrMove_.reset(); //release mouse capture *before* sending the event

            if (realMove)
            {
                if (refParent().allowColumnMove_)
                {
                    if (posTo > posFrom) //simulate "posFrom" deletion
                        --posTo;

                    if (posTo != posFrom)
                        if (const int col = refParent().columns_.displayPosToLogical(refParent().paneId_, posFrom);
                            col >= 0)
                            refParent().sendEvent(PaneColumnEvent(EVENT_PANE_COL_MOVE, col, 0, posFrom, posTo));
                }
            }
            else //notify single label click
                if (const int col = refParent().columns_.displayPosToLogical(refParent().paneId_, posFrom);
                    col >= 0)
                    refParent().sendEvent(PaneColumnEvent(EVENT_PANE_COL_CLICK, col, 0, posFrom, posFrom));
        }

        refParent().updateWindowSizes();
        refParent().Refresh();
        event.Skip();
    }

    void onMouseMovement(wxMouseEvent& event) override
    {
        const wxPoint clientPos = event.GetPosition();

        if (activeResizing_)
        {
            const int newWidth = activeResizing_->getStartWidth() + clientPos.x - activeResizing_->getStartPosX();

            refParent().sendEvent(PaneColumnEvent(EVENT_PANE_COL_RESIZE, activeResizing_->getColumn(), newWidth, 0, 0));
            Refresh();
        }
        else if (activeClickOrMove_)
        {
            if (std::abs(clientPos.x - activeClickOrMove_->getStartPosX()) > dipToWxsize(COLUMN_MOVE_DELAY_DIP)) //real move (not a single click)
            {
                activeClickOrMove_->setRealMove();
                activeClickOrMove_->refPosTo() = clientPosToMoveTargetPos(clientPos);
                Refresh();
            }
        }
        else
        {
            if (const std::optional<ColAction> action = clientPosToColumnAction(clientPos))
            {
                setMouseHighlight(action->pos);
                SetCursor(action->wantResize ? wxCURSOR_SIZEWE : *wxSTANDARD_CURSOR); //window-local only
            }
            else
            {
                setMouseHighlight(std::nullopt);
                SetCursor(*wxSTANDARD_CURSOR);
            }
        }
        event.Skip();
    }

    void onMouseCaptureLost(wxMouseCaptureLostEvent& event) override
    {
        if (activeResizing_ || activeClickOrMove_)
        {
            activeResizing_   .reset();
            activeClickOrMove_.reset();
            Refresh();
        }
        setMouseHighlight(std::nullopt);
        //event.Skip(); -> we DID handle it!
    }

    void onLeaveWindow(wxMouseEvent& event) override
    {
        if (!activeResizing_ && !activeClickOrMove_) //wxEVT_LEAVE_WINDOW does not respect mouse capture!
            setMouseHighlight(std::nullopt);
        event.Skip();
    }

    void setMouseHighlight(const std::optional<size_t>& hl)
    {
        if (highlightPos_ != hl)
        {
            highlightPos_ = hl;
            Refresh();
        }
    }

    std::unique_ptr<ColumnResizing> activeResizing_;
    std::unique_ptr<ColumnMove>     activeClickOrMove_;
    std::optional<size_t>           highlightPos_;

    int headerHeight_ = 0;
    const wxFont labelFont_;
};

//----------------------------------------------------------------------------------------------------------------

class Pane::BodyWin : public SubWindow
{
public:
    BodyWin(Pane& parent, HeaderWin& headerWin) : SubWindow(parent), headerWin_(headerWin)
    {
        Bind(wxEVT_SET_FOCUS,  [this](wxFocusEvent& event) { refParent().sendEvent(wxCommandEvent(EVENT_PANE_FOCUS)); Refresh(); event.Skip(); });
        Bind(wxEVT_KILL_FOCUS, [this](wxFocusEvent& event) { Refresh(); event.Skip(); });
    }

    wxRect getCheckBoxRect(const wxRect& cellRect) const
    {
        const wxSize cbSize = wxRendererNative::Get().GetCheckBoxSize(const_cast<BodyWin*>(this));
        return wxRect(cellRect.x + dipToWxsize(COLUMN_GAP_LEFT_DIP),
                      cellRect.y + (cellRect.height - cbSize.GetHeight()) / 2, cbSize.GetWidth(), cbSize.GetHeight());
    }

    //cell of the first column (logical 0) in this pane, empty if not shown here
    wxRect getFirstColumnCellRect(size_t row) const
    {
        int x = 0;
        for (const PaneColumn& pc : refParent().getPaneColumns())
        {
            if (pc.col == 0)
            {
                const wxPoint tl = refParent().CalcScrolledPosition(wxPoint(x, static_cast<int>(row) * refParent().rowHeight_));
                return wxRect(tl, wxSize(pc.width, refParent().rowHeight_));
            }
            x += pc.width;
        }
        return wxRect();
    }

private:
    void onBeforePaint() override { refParent().sendEvent(wxCommandEvent(EVENT_PANE_PAINT_BEGIN)); }

    void render(wxDC& dc, const wxRect& rect) override
    {
        clearArea(dc, rect, wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW));

        Pane& pane = refParent();
        if (!pane.bridge_)
            return;

        dc.SetFont(GetFont());
        dc.SetTextForeground(wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOWTEXT));

        const auto& [rowFirst, rowLast] = pane.getVisibleRows(rect);
        if (rowFirst >= rowLast)
            return;

        try
        {
            pane.bridge_->prepareRows(rowFirst, rowLast - 1); //throw ModelError
        }
        catch (const ModelError& e) { logExtraError(e.toString()); } //paint what the model has

        const std::vector<PaneColumn> paneCols = pane.getPaneColumns();

        int totalRowWidth = 0;
        for (const PaneColumn& pc : paneCols)
            totalRowWidth += pc.width;
        totalRowWidth = std::max(totalRowWidth, GetClientSize().GetWidth()); //fill gap after columns

        RecursiveDcClipper dummy(dc, rect); //do NOT draw background on cells outside of invalidated rect

        const wxPoint gridAreaTL(pane.CalcScrolledPosition(wxPoint(0, 0))); //client coordinates
        const bool focused = wxWindow::FindFocus() == this;

        for (ptrdiff_t row = rowFirst; row < rowLast; ++row)
        {
            const wxRect rowRect(gridAreaTL + wxPoint(0, static_cast<int>(row) * pane.rowHeight_), wxSize(totalRowWidth, pane.rowHeight_));
            const bool selected = pane.isSelected(row);

            RecursiveDcClipper dummy2(dc, rowRect);

            if (selected)
                dc.GradientFillLinear(rowRect, getColorSelectionGradientFrom(), getColorSelectionGradientTo(), wxEAST);
            else if (row == pane.hoverRow_)
                clearArea(dc, rowRect, getColorHover());

            wxRect cellRect = rowRect;
            for (const PaneColumn& pc : paneCols)
            {
                cellRect.width = pc.width;

                if (cellRect.x > rect.GetRight())
                    break; //done

                if (cellRect.x + pc.width > rect.x)
                {
                    RecursiveDcClipper dummy3(dc, cellRect);
                    renderCell(dc, cellRect, row, pc.col, selected);
                }
                cellRect.x += pc.width;
            }

            if (focused && row == pane.focusRow_)
                drawRectangleBorder(dc, rowRect, getColorSelectionGradientFrom().ChangeLightness(70), dipToWxsize(1));
        }
    }

    void renderCell(wxDC& dc, const wxRect& rect, size_t row, size_t col, bool selected)
    {
        DataBridge& bridge = *refParent().bridge_;
        const CellStyle style = bridge.getCellStyle(row, col);

        if (auto painter = dynamic_cast<WxCellPainter*>(style.painter.get()))
            return painter->paint(dc, rect, style, selected);

        if (style.background && !selected)
            clearArea(dc, rect, toWxColor(*style.background));

        //cell border: right + bottom
        clearArea(dc, {rect.x + rect.width - dipToWxsize(1), rect.y, dipToWxsize(1), rect.height}, getColorGridLine());
        clearArea(dc, {rect.x, rect.y + rect.height - dipToWxsize(1), rect.width, dipToWxsize(1)}, getColorGridLine());

        wxRect rectTmp(rect.x, rect.y, rect.width - dipToWxsize(1), rect.height - dipToWxsize(1));
        rectTmp.x     += dipToWxsize(COLUMN_GAP_LEFT_DIP);
        rectTmp.width -= dipToWxsize(COLUMN_GAP_LEFT_DIP);

        if (col == 0 && refParent().checkBoxes_)
            if (const std::optional<bool> checked = bridge.getChecked(row, col))
            {
                const wxRect cbRect = getCheckBoxRect(rect);
                wxRendererNative::Get().DrawCheckBox(this, dc, cbRect, *checked ? wxCONTROL_CHECKED : 0);

                rectTmp.x     += cbRect.width + dipToWxsize(COLUMN_GAP_LEFT_DIP);
                rectTmp.width -= cbRect.width + dipToWxsize(COLUMN_GAP_LEFT_DIP);
            }

        if (const int imgIdx = bridge.getImageIndex(row, col);
            imgIdx >= 0)
            if (auto bitmaps = dynamic_cast<const BitmapList*>(bridge.getImageList()))
                if (const wxBitmap* bmp = bitmaps->getBitmap(imgIdx))
                {
                    dc.DrawBitmap(*bmp, rectTmp.x, rectTmp.y + (rectTmp.height - bmp->GetHeight()) / 2, true /*useMask*/);

                    rectTmp.x     += bmp->GetWidth() + dipToWxsize(COLUMN_GAP_LEFT_DIP);
                    rectTmp.width -= bmp->GetWidth() + dipToWxsize(COLUMN_GAP_LEFT_DIP);
                }

        wxDCTextColourChanger textColor(dc);
        if (selected) //accessibility: always set *both* foreground AND background colors!
            textColor.Set(*wxBLACK);
        else if (style.textColor)
            textColor.Set(toWxColor(*style.textColor));

        wxDCFontChanger fontChanger(dc);
        if (style.font)
            fontChanger.Set(toWxFont(GetFont(), *style.font));

        drawTextTruncated(dc, rectTmp, bridge.getCellText(row, col), toWxAlignment(refParent().columns_.getColumn(col).alignment));
    }

    void onMouseLeftDown(wxMouseEvent& event) override
    {
        Pane& pane = refParent();
        const ptrdiff_t rowCount = pane.getRowCount();
        const ptrdiff_t row = pane.getRowAtWinPos(event.GetPosition().y); //return -1 for invalid position; >= rowCount if out of range

        if (wxWindow::FindFocus() != this)
            SetFocus();

        pane.sendEvent(PaneRowEvent(EVENT_PANE_MOUSE_DOWN, row));

        if (row >= rowCount) //empty space below the last row
        {
            if (pane.multiSelection_)
                pane.clearSelection();
        }
        else if (row >= 0)
        {
            if (pane.checkBoxes_)
                if (const wxRect cellRect = getFirstColumnCellRect(row);
                    !cellRect.IsEmpty() && getCheckBoxRect(cellRect).Contains(event.GetPosition()))
                {
                    pane.sendEvent(PaneRowEvent(EVENT_PANE_CHECK_CLICK, row));
                    return event.Skip();
                }

            if (pane.multiSelection_ && event.ControlDown())
            {
                pane.setCursor(row);
                pane.setSelected(row, !pane.isSelected(row));
            }
            else if (pane.multiSelection_ && event.ShiftDown())
                pane.selectRange(pane.anchorRow_, row);
            else
                pane.selectRowExclusively(row);
        }
        event.Skip(); //allow changing focus
    }

    void onMouseLeftDouble(wxMouseEvent& event) override
    {
        Pane& pane = refParent();
        const ptrdiff_t row = pane.getRowAtWinPos(event.GetPosition().y);

        pane.sendEvent(PaneRowEvent(EVENT_PANE_DOUBLE_CLICK, row));

        if (0 <= row && row < static_cast<ptrdiff_t>(pane.getRowCount()))
            pane.sendEvent(PaneRowEvent(EVENT_PANE_ROW_ACTIVATED, row));
        event.Skip();
    }

    void onMouseMovement(wxMouseEvent& event) override
    {
        refParent().setHoverRow(refParent().getRowAtWinPos(event.GetPosition().y));
        refParent().sendEvent(PaneMouseEvent(EVENT_PANE_MOUSE_MOVE, event.GetPosition().y));
        event.Skip();
    }

    void onLeaveWindow(wxMouseEvent& event) override
    {
        refParent().setHoverRow(-1);
        refParent().sendEvent(PaneMouseEvent(EVENT_PANE_MOUSE_LEAVE, 0));
        event.Skip();
    }

    void ScrollWindow(int dx, int dy, const wxRect* rect) override
    {
        wxWindow::ScrollWindow(dx, dy, rect);
        headerWin_.ScrollWindow(dx, 0, rect);

        //scroll rate is one row: dy is a multiple of the row height
        if (dy != 0)
            refParent().sendEvent(PaneMouseEvent(EVENT_PANE_SCROLLED, -dy / refParent().rowHeight_));
    }

    HeaderWin& headerWin_;
};

//----------------------------------------------------------------------------------------------------------------

Pane::Pane(wxWindow* parent, PaneId paneId, const ColumnRegistry& columns) :
    wxScrolledWindow(parent, wxID_ANY, wxDefaultPosition, wxDefaultSize, wxWANTS_CHARS | wxBORDER_NONE),
    paneId_(paneId),
    columns_(columns)
{
    headerWin_ = new HeaderWin(*this);             //ownership handled by "this"
    bodyWin_   = new BodyWin  (*this, *headerWin_); //

    SetTargetWindow(bodyWin_);

    //the frozen pane follows the normal pane's scrolling
    if (paneId_ == PaneId::frozen)
        ShowScrollbars(wxSHOW_SB_NEVER, wxSHOW_SB_NEVER);

    rowHeight_ = std::max(GetCharHeight() + dipToWxsize(4) + dipToWxsize(1),
                          wxRendererNative::Get().GetCheckBoxSize(this).GetHeight() + dipToWxsize(2));

    Bind(wxEVT_PAINT, [this](wxPaintEvent& event) { wxPaintDC dc(this); });
    Bind(wxEVT_SIZE,  [this](wxSizeEvent&  event) { updateWindowSizes(); event.Skip(); });
    Bind(wxEVT_ERASE_BACKGROUND, [](wxEraseEvent& event) {});

    Bind(wxEVT_KEY_DOWN, [this](wxKeyEvent& event) { onKeyDown(event); });
}


std::vector<Pane::PaneColumn> Pane::getPaneColumns() const
{
    std::vector<PaneColumn> paneCols;
    const size_t colCount = columns_.visibleCount(paneId_);
    for (size_t pos = 0; pos < colCount; ++pos)
        if (const int col = columns_.displayPosToLogical(paneId_, pos);
            col >= 0)
            paneCols.push_back({static_cast<size_t>(col), columns_.getColumn(col).width});
    return paneCols;
}


int Pane::getColumnsWidth() const
{
    int width = 0;
    for (const PaneColumn& pc : getPaneColumns())
        width += pc.width;
    return width;
}


int Pane::getHeaderHeight() const { return headerHidden_ ? 0 : headerWin_->getHeight(); }


wxSize Pane::GetSizeAvailableForScrollTarget(const wxSize& size)
{
    return wxSize(size.GetWidth(), std::max(0, size.GetHeight() - getHeaderHeight()));
}


void Pane::updateWindowSizes()
{
    const int headerHeight = getHeaderHeight();
    const wxSize clientSize = GetClientSize();

    headerWin_->SetSize(0, 0, clientSize.GetWidth(), headerHeight);
    bodyWin_  ->SetSize(0, headerHeight, clientSize.GetWidth(), std::max(0, clientSize.GetHeight() - headerHeight));

    headerWin_->Refresh();
    bodyWin_  ->Refresh();

    bodyWin_->SetVirtualSize(getColumnsWidth(), static_cast<int>(getRowCount()) * rowHeight_); //set before calling SetScrollRate()

    int ppsuX = 0; //pixel per scroll unit
    int ppsuY = 0;
    GetScrollPixelsPerUnit(&ppsuX, &ppsuY);
    if (ppsuX != rowHeight_ || ppsuY != rowHeight_)
        SetScrollRate(rowHeight_, rowHeight_);

    AdjustScrollbars(); //showing/hiding a scroll bar triggers a synchronous resize event => recursion, 2 levels at most
}


void Pane::onColumnsChanged()
{
    updateWindowSizes();
    Refresh();
}


void Pane::setRowHeight(int height)
{
    rowHeight_ = std::max(1, height);
    updateWindowSizes();
    Refresh();
}


void Pane::setHeaderHidden(bool hidden)
{
    headerHidden_ = hidden;
    headerWin_->Show(!hidden);
    updateWindowSizes();
}


void Pane::onKeyDown(wxKeyEvent& event)
{
    const ptrdiff_t rowCount  = getRowCount();
    const ptrdiff_t cursorRow = std::max<ptrdiff_t>(focusRow_, 0);
    const ptrdiff_t pageRows  = std::max(getRowsPerPage(), 1);

    auto moveCursorTo = [&](ptrdiff_t row)
    {
        if (rowCount > 0)
        {
            row = std::clamp<ptrdiff_t>(row, 0, rowCount - 1);

            if (multiSelection_ && event.ShiftDown())
                selectRange(anchorRow_, row);
            else
                selectRowExclusively(row);

            ensureVisible(row); //row is in range
        }
    };

    switch (event.GetKeyCode())
    {
        case WXK_UP:
        case WXK_NUMPAD_UP:
            return moveCursorTo(cursorRow - 1); //swallow event: wxScrolledWindow processes arrow keys

        case WXK_DOWN:
        case WXK_NUMPAD_DOWN:
            return moveCursorTo(focusRow_ < 0 ? 0 : cursorRow + 1);

        case WXK_HOME:
        case WXK_NUMPAD_HOME:
            return moveCursorTo(0);

        case WXK_END:
        case WXK_NUMPAD_END:
            return moveCursorTo(rowCount - 1);

        case WXK_PAGEUP:
        case WXK_NUMPAD_PAGEUP:
            return moveCursorTo(cursorRow - pageRows);

        case WXK_PAGEDOWN:
        case WXK_NUMPAD_PAGEDOWN:
            return moveCursorTo(cursorRow + pageRows);

        case WXK_RETURN:
        case WXK_NUMPAD_ENTER:
            if (0 <= focusRow_ && focusRow_ < rowCount)
                sendEvent(PaneRowEvent(EVENT_PANE_ROW_ACTIVATED, focusRow_));
            return;

        case WXK_SPACE:
            sendEvent(PaneRowEvent(EVENT_PANE_TOGGLE_KEY, focusRow_));
            return;

        case 'A': //Ctrl + A - select all
            if (event.ControlDown() && multiSelection_ && rowCount > 0)
                return selectRange(0, rowCount - 1);
            break;
    }
    event.Skip();
}

//----------------------------------------------------------------------------------------------------------------

int Pane::getHScrollBarHeight() const
{
    return std::max(0, GetSize().GetHeight() - GetClientSize().GetHeight()); //no borders: the difference is the scroll bar
}


int Pane::getClientWidth() const { return bodyWin_->GetClientSize().GetWidth(); }


int Pane::getRowsPerPage() const { return bodyWin_->GetClientSize().GetHeight() / rowHeight_; }


void Pane::setBounds(const PaneRect& rect)
{
    SetSize(rect.x, rect.y, rect.width, rect.height);
}


void Pane::scrollDelta(int deltaRows)
{
    const wxPoint scrollPosOld = GetViewStart();
    const int scrollPosNewY = std::max(0, scrollPosOld.y + deltaRows); //wxScrollHelper::Scroll() exits prematurely if input happens to be "-1"!

    if (scrollPosNewY != scrollPosOld.y)
        Scroll(scrollPosOld.x, scrollPosNewY); //internally calls wxWindows::Update()!
}


void Pane::scrollByPixels(int dy)
{
    scrollDelta(dy / rowHeight_);
}


void Pane::forwardMouseMove(int y)
{
    setHoverRow(getRowAtWinPos(y));
}


void Pane::forwardMouseLeave()
{
    setHoverRow(-1);
}


void Pane::forwardMouseWheel(int rotation, int wheelDelta)
{
    if (wheelDelta <= 0)
        return;

    mouseRotateRemainder_ += -rotation;
    int rotations = mouseRotateRemainder_ / wheelDelta;
    mouseRotateRemainder_ -= rotations * wheelDelta;

    if (rotations == 0) //tiny rotations: always scroll a single row at least
    {
        rotations = -numeric::sign(rotation);
        mouseRotateRemainder_ = 0;
    }
    scrollDelta(rotations * LINES_PER_WHEEL_ROTATION);
}


void Pane::setFocus() { bodyWin_->SetFocus(); }


bool Pane::hasFocus() const { return wxWindow::FindFocus() == bodyWin_; }


void Pane::setHoverRow(ptrdiff_t row)
{
    if (row >= static_cast<ptrdiff_t>(getRowCount()))
        row = -1;

    if (hoverRow_ != row)
    {
        if (hoverRow_ >= 0)
            redrawRow(hoverRow_);
        hoverRow_ = row;
        if (hoverRow_ >= 0)
            redrawRow(hoverRow_);
    }
}


ptrdiff_t Pane::getRowAtWinPos(int posY) const
{
    const int absY = CalcUnscrolledPosition(wxPoint(0, posY)).y;
    if (absY < 0)
        return -1;

    return std::min<ptrdiff_t>(absY / rowHeight_, getRowCount());
}


std::pair<ptrdiff_t, ptrdiff_t> Pane::getVisibleRows(const wxRect& clientRect) const //returns range [begin, end)
{
    if (clientRect.height > 0)
    {
        const ptrdiff_t rowFrom = getRowAtWinPos(clientRect.y);
        const ptrdiff_t rowTo   = getRowAtWinPos(clientRect.GetBottom());

        return {std::max<ptrdiff_t>(rowFrom, 0),
                std::min<ptrdiff_t>(rowTo + 1, getRowCount())};
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------

void Pane::setRowCount(size_t rowCount)
{
    selected_.resize(rowCount);

    if (focusRow_ >= static_cast<ptrdiff_t>(rowCount))
        focusRow_ = -1;
    if (hoverRow_ >= static_cast<ptrdiff_t>(rowCount))
        hoverRow_ = -1;
    anchorRow_ = std::min(anchorRow_, rowCount);

    updateWindowSizes();
    Refresh();
}


void Pane::setItemState(int row, bool focused, bool selected) //throw NativeError
{
    if (row == -1)
    {
        std::fill(selected_.begin(), selected_.end(), selected);
        if (!focused)
            focusRow_ = -1;
        return Refresh();
    }

    if (row < 0 || row >= static_cast<int>(selected_.size()))
        throw NativeError(replaceCpy(_("Cannot set the state of row %x."), L"%x", numberTo<std::wstring>(row)),
                          replaceCpy(_("The table has %x rows."), L"%x", numberTo<std::wstring>(selected_.size())));

    if (selected && !multiSelection_) //single selection: selecting a row deselects all others
        for (size_t i = 0; i < selected_.size(); ++i)
            if (selected_[i] && i != static_cast<size_t>(row))
            {
                selected_[i] = false;
                redrawRow(i);
            }

    selected_[row] = selected;

    if (focused)
    {
        if (focusRow_ >= 0 && focusRow_ != row)
            redrawRow(focusRow_);
        focusRow_  = row;
        anchorRow_ = row;
    }
    else if (focusRow_ == row)
        focusRow_ = -1;

    redrawRow(row);
}


void Pane::ensureVisible(size_t row) //throw NativeError
{
    if (row >= getRowCount())
        throw NativeError(replaceCpy(_("Cannot scroll to row %x."), L"%x", numberTo<std::wstring>(row)),
                          replaceCpy(_("The table has %x rows."), L"%x", numberTo<std::wstring>(getRowCount())));

    const int rowTop = static_cast<int>(row) * rowHeight_;
    const wxPoint scrollPosOld = GetViewStart();
    const int clientPosY = CalcScrolledPosition(wxPoint(0, rowTop)).y;
    const int clientHeight = bodyWin_->GetClientSize().GetHeight();

    if (clientPosY < 0)
        Scroll(scrollPosOld.x, rowTop / rowHeight_);
    else if (clientPosY + rowHeight_ > clientHeight)
        Scroll(scrollPosOld.x, numeric::intDivCeil(rowTop + rowHeight_ - clientHeight, rowHeight_));
}


std::vector<size_t> Pane::getSelectedRows() const
{
    std::vector<size_t> rows;
    for (size_t row = 0; row < selected_.size(); ++row)
        if (selected_[row])
            rows.push_back(row);
    return rows;
}


void Pane::redrawRow(size_t row)
{
    const wxPoint topLeft = CalcScrolledPosition(wxPoint(0, static_cast<int>(row) * rowHeight_)); //logical -> window coordinates
    bodyWin_->RefreshRect(wxRect(topLeft, wxSize(std::max(getColumnsWidth(), bodyWin_->GetClientSize().GetWidth()), rowHeight_)));
}


void Pane::setSortIndicator(int visualCol, SortOrder order)
{
    sortVisualCol_ = visualCol;
    sortOrder_ = order;
    headerWin_->Refresh();
}

//----------------------------------------------------------------------------------------------------------------

void Pane::setCursor(size_t row)
{
    if (focusRow_ >= 0)
        redrawRow(focusRow_);

    focusRow_  = row;
    anchorRow_ = row;
    redrawRow(row);
}


void Pane::setSelected(size_t row, bool selected)
{
    const bool before = isSelected(row);
    if (before != selected)
    {
        selected_[row] = selected;
        redrawRow(row);
        sendEvent(PaneItemStateEvent(row, before, selected));
    }
}


void Pane::clearSelection()
{
    if (std::any_of(selected_.begin(), selected_.end(), [](char s) { return s != 0; }))
    {
        std::fill(selected_.begin(), selected_.end(), false);
        Refresh();
        sendEvent(PaneItemStateEvent(-1, true, false));
    }
}


void Pane::selectRowExclusively(size_t row)
{
    if (multiSelection_)
        clearSelection();
    else
        for (size_t i = 0; i < selected_.size(); ++i)
            if (selected_[i] && i != row)
                setSelected(i, false);

    setCursor(row);
    setSelected(row, true);
}


void Pane::selectRange(size_t rowFrom, size_t rowTo)
{
    const size_t rowFirst = std::min(rowFrom, rowTo);
    const size_t rowLast  = std::min(std::max(rowFrom, rowTo) + 1, selected_.size()); //anchor may be "out of range"

    std::fill(selected_.begin(), selected_.end(), false);
    if (rowFirst < rowLast)
        std::fill(selected_.begin() + rowFirst, selected_.begin() + rowLast, true);

    focusRow_ = rowTo;
    Refresh();

    //report the range once: the receiver re-reads all selected rows
    sendEvent(PaneItemStateEvent(rowTo, false, true));
}
