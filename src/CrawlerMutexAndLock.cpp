// =====================================================================================
//
//       Filename:  CrawlerMutexAndLock.cpp
//
//    Description:  serialize work on the same key (accession number) between threads
//
//        Version:  1.0
//        Created:  10/04/2026 03:44:21 PM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

	/* This file is part of XBRL_Crawler. */

	/* XBRL_Crawler is free software: you can redistribute it and/or modify */
	/* it under the terms of the GNU General Public License as published by */
	/* the Free Software Foundation, either version 3 of the License, or */
	/* (at your option) any later version. */

	/* XBRL_Crawler is distributed in the hope that it will be useful, */
	/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
	/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
	/* GNU General Public License for more details. */

	/* You should have received a copy of the GNU General Public License */
	/* along with XBRL_Crawler.  If not, see <http://www.gnu.org/licenses/>. */

#include "CrawlerMutexAndLock.h"

#include <chrono>
#include <thread>

bool KeyedMutex::AddEntry(const std::string &key)
{
    std::lock_guard<std::mutex> lk{m_};
    auto [pos, inserted] = active_keys_.insert(key);
    return inserted;
}    // -----  end of method KeyedMutex::AddEntry  -----

void KeyedMutex::RemoveEntry(const std::string &key)
{
    std::lock_guard<std::mutex> lk{m_};
    active_keys_.erase(key);
}    // -----  end of method KeyedMutex::RemoveEntry  -----

bool KeyedMutex::IsActive(const std::string &key)
{
    std::lock_guard<std::mutex> lk{m_};
    return active_keys_.contains(key);
}    // -----  end of method KeyedMutex::IsActive  -----

//--------------------------------------------------------------------------------------
//       Class:  KeyedLock
//      Method:  KeyedLock
// Description:  constructor
//--------------------------------------------------------------------------------------
KeyedLock::KeyedLock(KeyedMutex* active_keys, const std::string& key)
    : active_keys_{active_keys}, key_{key}, lock_is_active_{false}
{
    // loop forever while trying to acquire our lock
    while (!lock_is_active_)
    {
        if (active_keys_->AddEntry(key_))
        {
            lock_is_active_ = true;
        }
        else
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{20});
        }
    }
}    // -----  end of method KeyedLock::KeyedLock  (constructor)  -----

KeyedLock::~KeyedLock()
{
    if (lock_is_active_)
    {
        active_keys_->RemoveEntry(key_);
    }
}    // -----  end of method KeyedLock::~KeyedLock  -----
