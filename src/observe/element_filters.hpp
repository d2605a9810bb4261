#pragma once

#include <QSet>
#include <QString>

namespace tether {

// Data-driven filter lists for one UI framework. `noiseTypes` are container
// classes/roles emitted only when they carry content or interactivity;
// `reservedIds` are system identifiers that are never emitted.
struct ElementFilters {
    QSet<QString> noiseTypes;
    QSet<QString> reservedIds;

    static ElementFilters androidDefaults();
    static ElementFilters iosDefaults();
};

inline ElementFilters ElementFilters::androidDefaults()
{
    ElementFilters filters;
    filters.noiseTypes = {
        QStringLiteral("android.view.View"),
        QStringLiteral("android.view.ViewGroup"),
        QStringLiteral("android.widget.FrameLayout"),
        QStringLiteral("android.widget.LinearLayout"),
        QStringLiteral("android.widget.RelativeLayout"),
        QStringLiteral("androidx.compose.ui.platform.ComposeView"),
        QStringLiteral("android.widget.ScrollView"),
        QStringLiteral("android.widget.HorizontalScrollView"),
        QStringLiteral("androidx.recyclerview.widget.RecyclerView"),
        QStringLiteral("androidx.viewpager2.widget.ViewPager2"),
        QStringLiteral("androidx.constraintlayout.widget.ConstraintLayout"),
        QStringLiteral("androidx.coordinatorlayout.widget.CoordinatorLayout"),
        QStringLiteral("androidx.appcompat.widget.ActionBarOverlayLayout"),
        QStringLiteral("androidx.appcompat.widget.ContentFrameLayout"),
        QStringLiteral("androidx.appcompat.widget.FitWindowsLinearLayout"),
        QStringLiteral("android.widget.ContentFrameLayout"),
    };
    filters.reservedIds = {
        QStringLiteral("android:id/statusBarBackground"),
        QStringLiteral("android:id/navigationBarBackground"),
        QStringLiteral("android:id/content"),
        QStringLiteral("android:id/action_bar_container"),
    };
    return filters;
}

inline ElementFilters ElementFilters::iosDefaults()
{
    ElementFilters filters;
    filters.noiseTypes = {
        QStringLiteral("AXWindow"),
        QStringLiteral("AXGroup"),
        QStringLiteral("AXScrollArea"),
        QStringLiteral("AXLayoutArea"),
        QStringLiteral("AXSplitGroup"),
        QStringLiteral("AXList"),
        QStringLiteral("AXTable"),
        QStringLiteral("AXOutline"),
        QStringLiteral("AXRow"),
        QStringLiteral("AXColumn"),
        QStringLiteral("AXCell"),
    };
    return filters;
}

} // namespace tether
