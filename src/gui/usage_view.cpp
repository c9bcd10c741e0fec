/*
 * usage_view.cpp - Implementation of the GTK usage view
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

#include "gamesentry/gui/usage_view.h"
#include "gamesentry/time_utils.h"
#include <sstream>
#include <iomanip>

namespace gamesentry {

UsageView::UsageView() {
    frame_ = gtk_frame_new("Today");

    box_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
    gtk_widget_set_margin_start(box_, 8);
    gtk_widget_set_margin_end(box_, 8);
    gtk_widget_set_margin_top(box_, 8);
    gtk_widget_set_margin_bottom(box_, 8);

    remaining_label_ = gtk_label_new("Unlimited");
    gtk_label_set_xalign(GTK_LABEL(remaining_label_), 0);
    gtk_widget_add_css_class(remaining_label_, "time-left");
    gtk_box_append(GTK_BOX(box_), remaining_label_);

    progress_bar_ = gtk_progress_bar_new();
    gtk_progress_bar_set_show_text(GTK_PROGRESS_BAR(progress_bar_), TRUE);
    gtk_box_append(GTK_BOX(box_), progress_bar_);

    label_ = gtk_label_new("Nothing played yet");
    gtk_label_set_xalign(GTK_LABEL(label_), 0);
    gtk_box_append(GTK_BOX(box_), label_);

    gtk_frame_set_child(GTK_FRAME(frame_), box_);
}

void UsageView::update(const EnforcementSnapshot& snapshot) {
    std::ostringstream label_text;
    label_text << format_duration(snapshot.accumulated) << " played today";

    if (!snapshot.remaining || !snapshot.daily_allowance) {
        gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), 0);
        gtk_progress_bar_set_text(GTK_PROGRESS_BAR(progress_bar_), "No daily limit");
        gtk_label_set_text(GTK_LABEL(remaining_label_), "Unlimited");
        gtk_label_set_text(GTK_LABEL(label_), label_text.str().c_str());
        set_band_class(nullptr);
        return;
    }

    int64_t allowance = snapshot.daily_allowance->count();
    double used = allowance > 0
        ? static_cast<double>(snapshot.accumulated.count()) / allowance
        : 1.0;
    if (used > 1.0) used = 1.0;
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), used);

    std::ostringstream text;
    text << std::fixed << std::setprecision(0) << (used * 100) << "% of "
         << allowance / 60 << " min";
    gtk_progress_bar_set_text(GTK_PROGRESS_BAR(progress_bar_), text.str().c_str());

    gtk_label_set_text(GTK_LABEL(remaining_label_),
                       format_time_remaining(*snapshot.remaining).c_str());
    switch (time_band(*snapshot.remaining)) {
        case TimeBand::PLENTY: set_band_class("band-plenty"); break;
        case TimeBand::LOW: set_band_class("band-low"); break;
        case TimeBand::CRITICAL: set_band_class("band-critical"); break;
    }

    gtk_label_set_text(GTK_LABEL(label_), label_text.str().c_str());
}

void UsageView::reset() {
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), 0);
    gtk_progress_bar_set_text(GTK_PROGRESS_BAR(progress_bar_), "");
    gtk_label_set_text(GTK_LABEL(remaining_label_), "Unlimited");
    gtk_label_set_text(GTK_LABEL(label_), "Nothing played yet");
    set_band_class(nullptr);
}

void UsageView::set_band_class(const char* css_class) {
    if (band_class_ == css_class) return;
    if (band_class_) {
        gtk_widget_remove_css_class(remaining_label_, band_class_);
    }
    band_class_ = css_class;
    if (band_class_) {
        gtk_widget_add_css_class(remaining_label_, band_class_);
    }
}

} // namespace gamesentry
