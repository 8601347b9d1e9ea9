/*	BSD 3-Clause License

	Copyright (c) 2022-2024, Paul Varga
	All rights reserved.

	Redistribution and use in source and binary forms, with or without
	modification, are permitted provided that the following conditions are met:

	1. Redistributions of source code must retain the above copyright notice, this
	   list of conditions and the following disclaimer.

	2. Redistributions in binary form must reproduce the above copyright notice,
	   this list of conditions and the following disclaimer in the documentation
	   and/or other materials provided with the distribution.

	3. Neither the name of the copyright holder nor the names of its
	   contributors may be used to endorse or promote products derived from
	   this software without specific prior written permission.

	THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
	AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
	IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
	DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
	FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
	DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
	SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
	CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
	OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
	OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/

#ifndef INC_FM__GENERIC_MAP_HPP
#define INC_FM__GENERIC_MAP_HPP

#include "hash.hpp"
#include "robinhood.hpp"

#include <functional>
#include <initializer_list>
#include <memory>
#include <utility>

namespace fm
{

/**	A Robinhood-style open addressing hash map for keys of any type with an equality relation.
 *	@details Each slot's info carries a partial hash tag beside its distance. A probe only calls key_equal where the
 *	tag matches, so mismatching keys that share a home bucket are mostly rejected without touching the stored key.
 *	With TagBits bits, about one in 2^TagBits mismatching same-home keys reaches key_equal.
 *	@tparam Key The key type.
 *	@tparam T The mapped type.
 *	@tparam Hash The hasher type. Must not throw.
 *	@tparam KeyEqual The key equality comparison type.
 *	@tparam Allocator An std::allocator-like class, rebound internally.
 *	@tparam TagBits The width of the partial hash tag, 1 through 8. Taken from the low bits of the hash, which
 *	the Fibonacci index (drawn from the high bits of the hash's product) does not consume directly.
 */
template <
	typename Key,
	typename T,
	typename Hash = fm::hash<Key>,
	typename KeyEqual = std::equal_to<Key>,
	typename Allocator = std::allocator<std::pair<const Key, T>>,
	unsigned TagBits = 8>
class generic_map
	: private robinhood::hashtable<
		robinhood::policy<Key, T, robinhood::tagged_info<robinhood::distance_type, TagBits>>,
		Hash,
		KeyEqual,
		Allocator>
{
private:
	using hashtable_type = robinhood::hashtable<
		robinhood::policy<Key, T, robinhood::tagged_info<robinhood::distance_type, TagBits>>,
		Hash,
		KeyEqual,
		Allocator>;

public:
	using key_type = typename hashtable_type::key_type;
	using mapped_type = typename hashtable_type::mapped_type;
	using value_type = typename hashtable_type::value_type;
	using size_type = typename hashtable_type::size_type;
	using difference_type = std::ptrdiff_t;
	using hasher = typename hashtable_type::hasher;
	using key_equal = typename hashtable_type::key_equal;
	using allocator_type = typename hashtable_type::allocator_type;
	using reference = const value_type&;
	using const_reference = const value_type&;
	using iterator = typename hashtable_type::iterator;
	using const_iterator = typename hashtable_type::const_iterator;

	constexpr static float default_load_factor = robinhood::default_load_factor;
	constexpr static unsigned tag_bits = TagBits;

	generic_map();
	explicit generic_map(const size_type bucket_count,
		const float load_factor = default_load_factor,
		const hasher& hash = hasher(),
		const key_equal& equal = key_equal(),
		const allocator_type& alloc = allocator_type());
	generic_map(const size_type bucket_count, const float load_factor, const allocator_type& alloc);
	template <typename InputIt>
	generic_map(InputIt first, InputIt last,
		const size_type bucket_count = robinhood::default_bucket_count,
		const float load_factor = default_load_factor,
		const hasher& hash = hasher(),
		const key_equal& equal = key_equal(),
		const allocator_type& alloc = allocator_type());
	generic_map(std::initializer_list<std::pair<key_type, mapped_type>> init,
		const size_type bucket_count = robinhood::default_bucket_count,
		const float load_factor = default_load_factor,
		const hasher& hash = hasher(),
		const key_equal& equal = key_equal(),
		const allocator_type& alloc = allocator_type());
	generic_map(const generic_map& other);
	generic_map(generic_map&& other) noexcept;
	~generic_map() = default;

	generic_map& operator=(const generic_map& other);
	generic_map& operator=(generic_map&& other) noexcept;

	void swap(generic_map& other) noexcept;
	friend void swap(generic_map& lhs, generic_map& rhs) noexcept
	{
		lhs.swap(rhs);
	}

	using hashtable_type::begin;
	using hashtable_type::end;
	using hashtable_type::cbegin;
	using hashtable_type::cend;

	using hashtable_type::empty;
	using hashtable_type::size;
	using hashtable_type::clear;
	using hashtable_type::insert;
	using hashtable_type::get;
	using hashtable_type::update;
	using hashtable_type::erase;
	using hashtable_type::at;
	using hashtable_type::count;
	using hashtable_type::contains;
	using hashtable_type::find;

	using hashtable_type::bucket_count;
	using hashtable_type::max_bucket_count;
	using hashtable_type::bucket;
	using hashtable_type::load_factor;
	using hashtable_type::max_load_factor;
	using hashtable_type::reserve;

	using hashtable_type::slot_count;
	using hashtable_type::probe_length;
	using hashtable_type::probe_limit;
	using hashtable_type::max_probe_length;
	using hashtable_type::index_of;

	using hashtable_type::hash_function;
	using hashtable_type::key_eq;
	using hashtable_type::get_allocator;

	/**	Return the tag stored in the info of an occupied slot.
	 *	@param slot An occupied index less than slot_count().
	 *	@return The low tag_bits bits of the hash of the key at slot.
	 */
	std::uint8_t tag_at(const size_type slot) const noexcept
	{
		FM_ROBINHOOD_ASSERT(probe_length(slot) >= 0, "generic_map::tag_at expects an occupied slot.");
		return this->hashtable_type::get_buckets().get_info()[slot].get_tag();
	}

	friend bool operator==(const generic_map& lhs, const generic_map& rhs)
	{
		if (lhs.size() != rhs.size())
		{
			return false;
		}
		for (const value_type& entry : lhs)
		{
			const const_iterator it = rhs.find(entry.first);
			if (it == rhs.end() || !(it->second == entry.second))
			{
				return false;
			}
		}
		return true;
	}
	friend bool operator!=(const generic_map& lhs, const generic_map& rhs)
	{
		return !(lhs == rhs);
	}
};

template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::generic_map()
	: generic_map{ robinhood::default_bucket_count }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::generic_map(const size_type bucket_count, const float load_factor, const hasher& hash, const key_equal& equal, const allocator_type& alloc)
	: hashtable_type{ bucket_count, load_factor, hash, equal, alloc }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::generic_map(const size_type bucket_count, const float load_factor, const allocator_type& alloc)
	: hashtable_type{ bucket_count, load_factor, hasher(), key_equal(), alloc }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
template <typename InputIt>
generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::generic_map(InputIt first, const InputIt last, const size_type bucket_count, const float load_factor, const hasher& hash, const key_equal& equal, const allocator_type& alloc)
	: hashtable_type{ bucket_count, load_factor, hash, equal, alloc }
{
	for (; first != last; ++first)
	{
		insert(first->first, first->second);
	}
}
template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::generic_map(std::initializer_list<std::pair<key_type, mapped_type>> init, const size_type bucket_count, const float load_factor, const hasher& hash, const key_equal& equal, const allocator_type& alloc)
	: generic_map{ init.begin(), init.end(), bucket_count, load_factor, hash, equal, alloc }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::generic_map(const generic_map& other)
	: hashtable_type{ other }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::generic_map(generic_map&& other) noexcept
	: hashtable_type{ std::move(other) }
{ }

template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
auto generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::operator=(const generic_map& other) -> generic_map&
{
	this->hashtable_type::operator=(other);
	return *this;
}
template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
auto generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::operator=(generic_map&& other) noexcept -> generic_map&
{
	this->hashtable_type::operator=(std::move(other));
	return *this;
}

template <typename Key, typename T, typename Hash, typename KeyEqual, typename Allocator, unsigned TagBits>
void generic_map<Key, T, Hash, KeyEqual, Allocator, TagBits>::swap(generic_map& other) noexcept
{
	this->hashtable_type::swap(other);
}

} // namespace fm

#endif
