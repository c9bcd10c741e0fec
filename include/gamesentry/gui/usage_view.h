/*
 * usage_view.h - GTK widget showing today's play against the allowance
 * Copyright © 2026 Kirn Gill II <segin2005@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <gtk/gtk.h>
#include "gamesentry/common.h"

namespace gamesentry {

// Progress bar of played time against the daily allowance, plus the time left
class UsageView {
public:
    UsageView();

    GtkWidget* get_widget() const { return frame_; }

    void update(const EnforcementSnapshot& snapshot);
    void reset();

private:
    void set_band_class(const char* css_class);

    GtkWidget* frame_ = nullptr;
    GtkWidget* box_ = nullptr;
    GtkWidget* progress_bar_ = nullptr;
    GtkWidget* remaining_label_ = nullptr;
    GtkWidget* label_ = nullptr;
    const char* band_class_ = nullptr;
};

} // namespace gamesentry
