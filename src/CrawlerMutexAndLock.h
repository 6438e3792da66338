// =====================================================================================
//
//       Filename:  CrawlerMutexAndLock.h
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

#ifndef _CRAWLERMUTEXANDLOCK_INC_
#define _CRAWLERMUTEXANDLOCK_INC_

#include <mutex>
#include <set>
#include <string>

// =====================================================================================
//        Class:  KeyedMutex
//  Description:  the set of keys currently being worked on.
// =====================================================================================
class KeyedMutex
{
public:
    // ====================  LIFECYCLE     =======================================
    KeyedMutex() = default; // constructor
    KeyedMutex(const KeyedMutex &rhs) = delete;
    KeyedMutex(KeyedMutex &&rhs) = delete;

    // ====================  ACCESSORS     =======================================

    bool IsActive(const std::string &key);

    // ====================  MUTATORS      =======================================

    bool AddEntry(const std::string &key);
    void RemoveEntry(const std::string &key);

    // ====================  OPERATORS     =======================================

    KeyedMutex &operator=(const KeyedMutex &rhs) = delete;
    KeyedMutex &operator=(KeyedMutex &&rhs) = delete;

private:
    // ====================  DATA MEMBERS  =======================================

    std::mutex m_;
    std::set<std::string> active_keys_;

}; // -----  end of class KeyedMutex  -----

// =====================================================================================
//        Class:  KeyedLock
//  Description:  grant access to a key. uses KeyedMutex.
//                use RAII
// =====================================================================================
class KeyedLock
{
public:
    // ====================  LIFECYCLE     =======================================
    KeyedLock(KeyedMutex *active_keys, const std::string &key); // constructor
    ~KeyedLock();

    KeyedLock(const KeyedLock &rhs) = delete;
    KeyedLock &operator=(const KeyedLock &rhs) = delete;

private:
    // ====================  DATA MEMBERS  =======================================

    KeyedMutex *active_keys_;
    std::string key_;
    bool lock_is_active_;

}; // -----  end of class KeyedLock  -----

#endif // ----- #ifndef _CRAWLERMUTEXANDLOCK_INC_  -----
