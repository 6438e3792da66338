// =====================================================================================
//
//       Filename:  Crawler.h
//
//    Description:  holds some common type defs shared by several classes.
//
//        Version:  1.0
//        Created:  10/02/2026 09:12:31 AM
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

#ifndef CRAWLER_H_
#define CRAWLER_H_

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace Crawler
{
    // thanks to Jonathan Boccara of fluentcpp.com for his articles on
    // Strong Types and the NamedType library.
    //
    // this code is a simplified and somewhat stripped down version of his.

    // =====================================================================================
    //        Class:  UniqType
    //  Description: Provides a wrapper which makes embedded common data types distinguisable 
    // =====================================================================================

    template <typename T, typename Uniqueifier>
    class UniqType
    {
    public:
        // ====================  LIFECYCLE     ======================================= 

        UniqType() requires std::is_default_constructible_v<T>
            : value_{} {}

        UniqType(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_constructible_v<T>
            : value_{rhs.value_} {}

        explicit UniqType(T const& value) requires std::is_copy_constructible_v<T>
            : value_{value} {}

        UniqType(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_constructible_v<T>
            : value_(std::move(rhs.value_)) {}
        
        explicit UniqType(T&& value) requires std::is_move_constructible_v<T>
            : value_(std::move(value)) {}

        // ====================  ACCESSORS     ======================================= 

        T& get() { return value_; }
        const T& get() const { return value_; }

        // ====================  OPERATORS     ======================================= 

        UniqType& operator=(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = rhs.value_;
            }
            return *this;
        }
        UniqType& operator=(const T& rhs) requires std::is_copy_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = rhs;
            }
            return *this;
        }
        UniqType& operator=(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = std::move(rhs.value_);
            }
            return *this;
        }
        UniqType& operator=(T&& rhs) requires std::is_move_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = std::move(rhs);
            }
            return *this;
        }

    private:
        // ====================  DATA MEMBERS  ======================================= 
        
        T value_;

    }; // -----  end of class UniqType  ----- 

    using sv = std::string_view;
    using std::filesystem::path;

    // we don't want to have naked string_views all over the place so
    // lets' add a little type safety based on ideas from fluentcpp

    using DocumentContent = UniqType<sv, struct DocumentContentTag>;
    using LabelContent = UniqType<sv, struct LabelContentTag>;
    using FileName = UniqType<path, struct FileNameTag>;

    // concept name -> display label, taken from a label linkbase

    using ConceptLabels = std::map<std::string, std::string, std::less<>>;

}		// namespace Crawler

namespace XC = Crawler;

//  seems to be needed by boost program options

template <typename T, typename Uniqueifier>
std::ostream& operator<<(std::ostream& os, const XC::UniqType<T, Uniqueifier>& a_type)
{
    os << a_type.get();
    return os;
}

template <typename T, typename Uniqueifier>
std::istream& operator>>(std::istream& is, XC::UniqType<T, Uniqueifier>& a_type)
{
    T temp = a_type.get();
    is >> temp;
    a_type = temp;
    return is;
}

#endif /* end of include guard: CRAWLER_H_ */
