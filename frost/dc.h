// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef DC_H_5520183647291055832
#define DC_H_5520183647291055832

#include <cassert>
#include <cmath>
#include <optional>
#include <unordered_map>
#include <string_view>
#include <wx/dcbuffer.h>
#include <zen/string_tools.h>
#include <zen/utf.h>
#include <zen/zstring.h>
#include "table_model.h"


namespace frost
{
inline wxColor toWxColor(const Color& c) { return {c.r, c.g, c.b}; }

//wxsize equals DIP on GTK3
inline int dipToWxsize(int d) { return static_cast<int>(std::round(d - 0.1)); }
int dipToWxsize(double d) = delete;


inline
void clearArea(wxDC& dc, const wxRect& rect, const wxColor& col)
{
    if (rect.width  > 0 &&
        rect.height > 0)
    {
        //wxTRANSPARENT_PEN: don't widen the area by the pen width
        dc.SetPen(*wxTRANSPARENT_PEN);
        dc.SetBrush(col);
        dc.DrawRectangle(rect);
    }
}


inline
void drawRectangleBorder(wxDC& dc, const wxRect& rect, const wxColor& col, int borderSize)
{
    if (rect.width  > 0 &&
        rect.height > 0)
    {
        if (2 * borderSize >= std::min(rect.width, rect.height))
            return clearArea(dc, rect, col);

        dc.SetPen(*wxTRANSPARENT_PEN);
        dc.SetBrush(col);
        dc.DrawRectangle(rect.x, rect.y,                            borderSize, rect.height); //left
        dc.DrawRectangle(rect.x + rect.width - borderSize, rect.y,  borderSize, rect.height); //right
        dc.DrawRectangle(rect.x, rect.y,                            rect.width, borderSize);  //top
        dc.DrawRectangle(rect.x, rect.y + rect.height - borderSize, rect.width, borderSize);  //bottom
    }
}


//draw single-line text, truncated with an ellipsis if too wide; "alignment" as for wxDC::DrawLabel()
inline
void drawTextTruncated(wxDC& dc, const wxRect& rect, std::wstring_view text, int alignment)
{
    //wxDC::DrawLabel() measures the text three times: use wxDC::DrawText() only
    if (rect.width <= 0 || rect.height <= 0 || text.empty())
        return;

    wxString textTrunc(text.data(), text.size());
    wxSize extentTrunc = dc.GetTextExtent(textTrunc);

    if (extentTrunc.GetWidth() > rect.width)
    {
        //binary search over Unicode chars: never split a surrogate pair
        size_t low  = 0;
        size_t high = zen::unicodeLength(text);
        if (high > 1)
            for (;;)
            {
                if (high - low <= 1)
                {
                    if (low == 0)
                    {
                        textTrunc   = zen::ELLIPSIS;
                        extentTrunc = dc.GetTextExtent(textTrunc);
                    }
                    break;
                }
                const size_t middle = (low + high) / 2; //never 0 here

                wxString candidate = zen::getUnicodeSubstring<wxString>(text, 0, middle) + zen::ELLIPSIS;
                const wxSize extentCand = dc.GetTextExtent(candidate);

                if (extentCand.GetWidth() <= rect.width)
                {
                    low = middle;
                    textTrunc   = std::move(candidate);
                    extentTrunc = extentCand;
                }
                else
                    high = middle;
            }
    }

    wxPoint pt = rect.GetTopLeft();
    if (alignment & wxALIGN_RIGHT) //wxALIGN_LEFT == 0
        pt.x += rect.width - extentTrunc.GetWidth();
    else if (alignment & wxALIGN_CENTER_HORIZONTAL)
        pt.x += (rect.width - extentTrunc.GetWidth()) / 2;

    if (alignment & wxALIGN_CENTER_VERTICAL) //wxALIGN_TOP == 0
        pt.y += (rect.height - extentTrunc.GetHeight()) / 2;

    dc.DrawText(textTrunc, pt);
}


//wxDCClipper does not stack: each nested clipper intersects with the enclosing one
class RecursiveDcClipper
{
public:
    RecursiveDcClipper(wxDC& dc, const wxRect& r) : dc_(dc)
    {
        if (auto it = clippingAreas_.find(&dc);
            it != clippingAreas_.end())
        {
            oldRect_ = it->second;

            const wxRect tmp = r.Intersect(*oldRect_);
            dc.SetClippingRegion(tmp);
            it->second = tmp;
        }
        else
        {
            dc.SetClippingRegion(r);
            clippingAreas_.emplace(&dc, r);
        }
    }

    ~RecursiveDcClipper()
    {
        dc_.DestroyClippingRegion();
        if (oldRect_)
        {
            dc_.SetClippingRegion(*oldRect_);
            clippingAreas_[&dc_] = *oldRect_;
        }
        else
            clippingAreas_.erase(&dc_);
    }

private:
    RecursiveDcClipper           (const RecursiveDcClipper&) = delete;
    RecursiveDcClipper& operator=(const RecursiveDcClipper&) = delete;

    inline static std::unordered_map<wxDC*, wxRect> clippingAreas_; //"active" clipping area per DC

    std::optional<wxRect> oldRect_;
    wxDC& dc_;
};


//double-buffered paint DC reusing the caller's bitmap across paint events
class BufferedPaintDC : public wxMemoryDC
{
public:
    BufferedPaintDC(wxWindow& wnd, std::optional<wxBitmap>& buffer) : buffer_(buffer), paintDc_(&wnd)
    {
        const wxSize clientSize = wnd.GetClientSize();
        if (clientSize.GetWidth() > 0 && clientSize.GetHeight() > 0) //wxBitmap asserts a non-empty size
        {
            if (!buffer_ || buffer_->GetSize() != clientSize)
                buffer_.emplace(clientSize);

            SelectObject(*buffer_);
        }
        else
            buffer_.reset();
    }

    ~BufferedPaintDC()
    {
        if (buffer_)
        {
            const wxPoint origin = GetDeviceOrigin();
            paintDc_.Blit(0, 0, buffer_->GetWidth(), buffer_->GetHeight(), this, -origin.x, -origin.y);
        }
    }

private:
    BufferedPaintDC           (const BufferedPaintDC&) = delete;
    BufferedPaintDC& operator=(const BufferedPaintDC&) = delete;

    std::optional<wxBitmap>& buffer_;
    wxPaintDC paintDc_;
};
}

#endif //DC_H_5520183647291055832
