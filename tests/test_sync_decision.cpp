// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <cassert>
#include <iostream>
#include "../SiteSync/Source/base/sync_decision.h"
#include "../SiteSync/Source/base/synchronization.h"

using namespace sitesync;


static void test_target_missing()
{
    assert(shouldTransfer(false, std::nullopt, std::nullopt));
    assert(shouldTransfer(false, std::nullopt, 1000));
    assert(shouldTransfer(false, 5000, 1000)); //stale time of a missing target is irrelevant
}

static void test_compare_times()
{
    assert( shouldTransfer(true, 1000, 1001)); //source newer
    assert(!shouldTransfer(true, 1001, 1000)); //target newer
    assert(!shouldTransfer(true, 1000, 1000)); //tie: skip
}

static void test_unknown_times()
{
    assert(shouldTransfer(true, std::nullopt, 1000));
    assert(shouldTransfer(true, 1000, std::nullopt));
    assert(shouldTransfer(true, std::nullopt, std::nullopt));
}

static void test_success_rate()
{
    assert(isSyncSuccessful(SyncStats{}, 0.9)); //nothing to transfer
    assert(isSyncSuccessful(SyncStats{0, 20, 0, 0}, 0.9)); //everything up to date

    assert( isSyncSuccessful(SyncStats{19, 0, 1, 0}, 0.9));
    assert( isSyncSuccessful(SyncStats{18, 0, 2, 0}, 0.9)); //exactly at threshold
    assert(!isSyncSuccessful(SyncStats{17, 0, 3, 0}, 0.9));
    assert(!isSyncSuccessful(SyncStats{0,  5, 1, 0}, 0.9)); //skipped files don't count
}

int main()
{
    test_target_missing();
    test_compare_times();
    test_unknown_times();
    test_success_rate();
    std::cout << "All sync decision tests passed" << std::endl;
    return 0;
}
