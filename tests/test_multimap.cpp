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

#include <gtest/gtest.h>

#include <fm/multimap.hpp>

#include "test_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using fm::test::constant_hash;
using fm::test::counted_allocator;
using fm::test::dump_table;
using fm::test::modulo_hash;
using fm::test::robinhood_layout;

constexpr bool DEBUG_VERBOSE = false;

namespace
{
	template <typename K, typename V, typename H = fm::hash<K>>
	using counted_multimap = fm::multimap<K, V, H, std::equal_to<K>, std::equal_to<V>, counted_allocator<std::pair<const K, V>>>;

	template <typename Table>
	std::vector<typename Table::mapped_type> values_of(const Table& table, const typename Table::key_type& key)
	{
		std::vector<typename Table::mapped_type> result;
		table.get_all(key, std::back_inserter(result));
		return result;
	}

	/**	Check that the entries sharing each hash occupy consecutive slots.
	 */
	template <typename Table>
	::testing::AssertionResult contiguous_groups(const Table& table)
	{
		using size_type = typename Table::size_type;
		std::map<std::uint32_t, size_type> last_slot;
		for (size_type slot = 0; slot < table.slot_count(); ++slot)
		{
			if (table.probe_length(slot) < 0)
			{
				continue;
			}
			const std::uint32_t hash = table.hash_at(slot);
			const auto found = last_slot.find(hash);
			if (found != last_slot.end() && found->second + 1 != slot)
			{
				return ::testing::AssertionFailure() << "hash " << hash << " at slot " << slot
					<< " is separated from its group ending at slot " << found->second;
			}
			last_slot[hash] = slot;
		}
		return ::testing::AssertionSuccess();
	}

	class fm_multimap : public fm::test::counted_test
	{ };
} // namespace

TEST_F(fm_multimap, construct)
{
	counted_multimap<int, int> m;
	EXPECT_TRUE(m.empty());
	EXPECT_EQ(m.bucket_count(), 16u);
	EXPECT_EQ(m.max_load_factor(), 0.5f);
	EXPECT_EQ(m.probe_limit(), 5u);
	EXPECT_EQ(m.slot_count(), 16u + 5u + 1u + 127u);
	EXPECT_EQ(m.group_limit, 127u);
	EXPECT_THROW((counted_multimap<int, int>(16, 0.0f)), std::invalid_argument);
	EXPECT_EQ((counted_multimap<int, int>(16, 0.875f).probe_limit()), 6u);
}

TEST_F(fm_multimap, values_in_insertion_order)
{
	counted_multimap<int, int> m;
	EXPECT_TRUE(m.insert(1, 30));
	EXPECT_TRUE(m.insert(1, 10));
	EXPECT_TRUE(m.insert(2, 5));
	EXPECT_TRUE(m.insert(1, 20));
	EXPECT_EQ(m.size(), 4u);

	int value = 0;
	EXPECT_TRUE(m.get(1, value));
	EXPECT_EQ(value, 30);
	EXPECT_EQ(values_of(m, 1), (std::vector<int>{ 30, 10, 20 }));
	EXPECT_EQ(values_of(m, 2), (std::vector<int>{ 5 }));
	EXPECT_TRUE(values_of(m, 3).empty());
	EXPECT_FALSE(m.get(3, value));

	EXPECT_EQ(m.count(1), 3u);
	EXPECT_EQ(m.count(2), 1u);
	EXPECT_EQ(m.count(3), 0u);
	EXPECT_TRUE(robinhood_layout(m));
	EXPECT_TRUE(contiguous_groups(m));
}

TEST_F(fm_multimap, insert_duplicate_pair)
{
	counted_multimap<int, std::string> m;
	EXPECT_TRUE(m.insert(1, "a"));
	EXPECT_FALSE(m.insert(1, "a"));
	EXPECT_TRUE(m.insert(1, "b"));
	EXPECT_TRUE(m.insert(2, "a"));
	EXPECT_EQ(m.size(), 3u);
	EXPECT_EQ(m.count(1), 2u);
}

TEST_F(fm_multimap, contains)
{
	counted_multimap<int, int> m;
	m.insert(7, 70);
	m.insert(7, 71);
	EXPECT_TRUE(m.contains(7));
	EXPECT_FALSE(m.contains(8));
	EXPECT_TRUE(m.contains(7, 70));
	EXPECT_TRUE(m.contains(7, 71));
	EXPECT_FALSE(m.contains(7, 72));
	EXPECT_FALSE(m.contains(8, 70));
}

TEST_F(fm_multimap, erase)
{
	counted_multimap<int, int> m;
	for (const int value : { 10, 20, 30, 40 })
	{
		m.insert(1, value);
	}
	m.insert(2, 10);

	EXPECT_TRUE(m.erase(1, 20));
	EXPECT_FALSE(m.erase(1, 20));
	EXPECT_FALSE(m.erase(3, 10));
	EXPECT_EQ(values_of(m, 1), (std::vector<int>{ 10, 30, 40 }));
	EXPECT_TRUE(robinhood_layout(m));

	EXPECT_EQ(m.erase(1), 3u);
	EXPECT_EQ(m.erase(1), 0u);
	EXPECT_EQ(m.count(1), 0u);
	EXPECT_FALSE(m.contains(1));
	EXPECT_EQ(m.size(), 1u);
	EXPECT_TRUE(m.contains(2, 10));
	EXPECT_TRUE(robinhood_layout(m));
}

TEST_F(fm_multimap, update)
{
	counted_multimap<int, int> m;
	for (const int value : { 10, 20, 30 })
	{
		m.insert(1, value);
	}
	EXPECT_TRUE(m.update(1, 20, [](const int value) { return value + 1; }));
	EXPECT_EQ(values_of(m, 1), (std::vector<int>{ 10, 21, 30 }));

	// A replacement may not duplicate another of the key's values.
	EXPECT_FALSE(m.update(1, 21, [](const int) { return 10; }));
	EXPECT_EQ(values_of(m, 1), (std::vector<int>{ 10, 21, 30 }));

	EXPECT_TRUE(m.update(1, 30, [](const int value) { return value; }));
	EXPECT_FALSE(m.update(1, 99, [](const int value) { return value; }));
	EXPECT_FALSE(m.update(2, 10, [](const int value) { return value; }));
	EXPECT_EQ(m.size(), 3u);
}

TEST_F(fm_multimap, replace)
{
	counted_multimap<int, std::string> m;
	m.insert(4, "x");
	m.insert(4, "y");
	EXPECT_TRUE(m.replace(4, "x", "z"));
	EXPECT_EQ(values_of(m, 4), (std::vector<std::string>{ "z", "y" }));
	EXPECT_FALSE(m.replace(4, "z", "y"));
	EXPECT_FALSE(m.replace(4, "x", "w"));
	EXPECT_FALSE(m.replace(5, "z", "w"));
	std::string value;
	EXPECT_TRUE(m.get(4, value));
	EXPECT_EQ(value, "z");
}

TEST_F(fm_multimap, merge)
{
	counted_multimap<int, int> a;
	a.insert(1, 10);
	a.insert(1, 20);
	a.insert(2, 5);
	counted_multimap<int, int> b;
	b.insert(1, 20);
	b.insert(1, 30);
	b.insert(1, 40);
	b.insert(3, 7);
	b.insert(2, 5);

	EXPECT_EQ(a.merge(b), 3u);
	EXPECT_EQ(a.size(), 6u);
	EXPECT_EQ(values_of(a, 1), (std::vector<int>{ 10, 20, 30, 40 }));
	EXPECT_EQ(values_of(a, 2), (std::vector<int>{ 5 }));
	EXPECT_EQ(values_of(a, 3), (std::vector<int>{ 7 }));
	EXPECT_EQ(b.size(), 5u);
	EXPECT_TRUE(robinhood_layout(a));

	EXPECT_EQ(a.merge(a), 0u);
	EXPECT_EQ(a.size(), 6u);
	EXPECT_EQ(a.merge(b), 0u);
}

TEST_F(fm_multimap, merge_colliding_keys)
{
	counted_multimap<int, int, modulo_hash<8>> source;
	source.insert(1, 1);
	source.insert(9, 9);
	source.insert(1, 2);
	source.insert(9, 8);
	source.insert(17, 0);
	counted_multimap<int, int, modulo_hash<8>> target;
	target.insert(9, 7);

	EXPECT_EQ(target.merge(source), 5u);
	EXPECT_EQ(values_of(target, 1), (std::vector<int>{ 1, 2 }));
	EXPECT_EQ(values_of(target, 9), (std::vector<int>{ 7, 9, 8 }));
	EXPECT_EQ(values_of(target, 17), (std::vector<int>{ 0 }));
	EXPECT_TRUE(robinhood_layout(target));
	EXPECT_TRUE(contiguous_groups(target));
}

TEST_F(fm_multimap, merge_past_group_limit)
{
	counted_multimap<int, int, constant_hash> a;
	counted_multimap<int, int, constant_hash> b;
	for (int value = 0; value < 100; ++value)
	{
		a.insert(1, value);
		b.insert(2, value);
	}
	EXPECT_THROW(a.merge(b), std::length_error);
	EXPECT_EQ(a.size(), 127u);
	EXPECT_EQ(a.count(1), 100u);
	EXPECT_EQ(a.count(2), 27u);
	EXPECT_EQ(b.size(), 100u);
	EXPECT_TRUE(robinhood_layout(a));
}

TEST_F(fm_multimap, group_limit)
{
	counted_multimap<int, int, constant_hash> m;
	for (int value = 0; value < 127; ++value)
	{
		EXPECT_TRUE(m.insert(1, value));
	}
	EXPECT_EQ(m.size(), 127u);
	EXPECT_EQ(m.max_probe_length(), 126u);

	EXPECT_THROW(m.insert(1, 127), std::length_error);
	// Every key of the hash shares its group.
	EXPECT_THROW(m.insert(2, 0), std::length_error);
	EXPECT_FALSE(m.insert(1, 5));
	EXPECT_EQ(m.size(), 127u);

	std::vector<int> expected(127);
	for (int value = 0; value < 127; ++value)
	{
		expected[value] = value;
	}
	EXPECT_EQ(values_of(m, 1), expected);
	EXPECT_TRUE(robinhood_layout(m));
	EXPECT_TRUE(contiguous_groups(m));

	EXPECT_TRUE(m.erase(1, 0));
	EXPECT_TRUE(m.insert(2, 0));
	EXPECT_EQ(m.count(2), 1u);
	EXPECT_EQ(m.count(1), 126u);
}

TEST_F(fm_multimap, colliding_keys)
{
	// Keys congruent modulo 8 share a hash group.
	counted_multimap<int, int, modulo_hash<8>> m;
	for (int n = 0; n < 3; ++n)
	{
		for (int key = 0; key < 64; ++key)
		{
			EXPECT_TRUE(m.insert(key, key * 10 + n));
		}
	}
	if (DEBUG_VERBOSE)
	{
		dump_table(m);
	}
	EXPECT_EQ(m.size(), 192u);
	EXPECT_LE(m.load_factor(), m.max_load_factor());
	for (int key = 0; key < 64; ++key)
	{
		EXPECT_EQ(values_of(m, key), (std::vector<int>{ key * 10, key * 10 + 1, key * 10 + 2 }));
	}
	EXPECT_TRUE(robinhood_layout(m));
	EXPECT_TRUE(contiguous_groups(m));

	for (int key = 0; key < 64; key += 3)
	{
		EXPECT_EQ(m.erase(key), 3u);
	}
	for (int key = 1; key < 64; key += 3)
	{
		EXPECT_TRUE(m.erase(key, key * 10 + 1));
	}
	for (int key = 0; key < 64; ++key)
	{
		switch (key % 3)
		{
		case 0:
			EXPECT_TRUE(values_of(m, key).empty());
			break;
		case 1:
			EXPECT_EQ(values_of(m, key), (std::vector<int>{ key * 10, key * 10 + 2 }));
			break;
		default:
			EXPECT_EQ(values_of(m, key), (std::vector<int>{ key * 10, key * 10 + 1, key * 10 + 2 }));
			break;
		}
	}
	EXPECT_TRUE(robinhood_layout(m));
	EXPECT_TRUE(contiguous_groups(m));
}

TEST_F(fm_multimap, growth_keeps_order)
{
	counted_multimap<int, int> m;
	for (int n = 0; n < 50; ++n)
	{
		EXPECT_TRUE(m.insert(5, n));
		for (int other = 0; other < 20; ++other)
		{
			EXPECT_TRUE(m.insert(1000 + n * 20 + other, n));
		}
	}
	EXPECT_GT(m.bucket_count(), 1024u);
	EXPECT_LE(m.load_factor(), m.max_load_factor());
	std::vector<int> expected(50);
	for (int n = 0; n < 50; ++n)
	{
		expected[n] = n;
	}
	EXPECT_EQ(values_of(m, 5), expected);
	EXPECT_EQ(m.count(1000), 1u);
	EXPECT_TRUE(robinhood_layout(m));
	EXPECT_TRUE(contiguous_groups(m));
}

TEST_F(fm_multimap, hash_at)
{
	counted_multimap<int, int> m;
	for (int key = 0; key < 100; ++key)
	{
		m.insert(key, key);
		m.insert(key, -key - 1);
	}
	const auto hash = m.hash_function();
	for (auto it = m.begin(); it != m.end(); ++it)
	{
		EXPECT_EQ(m.hash_at(m.index_of(it)), hash(it->first));
	}
}

TEST_F(fm_multimap, clear)
{
	counted_multimap<int, std::string> m;
	for (int key = 0; key < 30; ++key)
	{
		m.insert(key, "a");
		m.insert(key, "b");
	}
	const auto bucket_count = m.bucket_count();
	m.clear();
	m.clear();
	EXPECT_TRUE(m.empty());
	EXPECT_EQ(m.bucket_count(), bucket_count);
	EXPECT_TRUE(m.begin() == m.end());
	EXPECT_FALSE(m.contains(1));
	EXPECT_TRUE(m.insert(1, "c"));
	EXPECT_EQ(values_of(m, 1), (std::vector<std::string>{ "c" }));
}

TEST_F(fm_multimap, copy_move_swap)
{
	counted_multimap<int, std::string> m;
	m.insert(1, "a");
	m.insert(1, "b");
	m.insert(2, "c");

	counted_multimap<int, std::string> copy{ m };
	EXPECT_EQ(copy.size(), 3u);
	EXPECT_EQ(values_of(copy, 1), (std::vector<std::string>{ "a", "b" }));
	copy.erase(1, "a");
	EXPECT_EQ(m.count(1), 2u);

	counted_multimap<int, std::string> moved{ std::move(m) };
	EXPECT_EQ(moved.size(), 3u);
	EXPECT_TRUE(m.empty());
	EXPECT_EQ(m.bucket_count(), 0u);
	EXPECT_TRUE(m.insert(9, "z"));
	EXPECT_LE(m.load_factor(), m.max_load_factor());

	swap(m, moved);
	EXPECT_EQ(m.size(), 3u);
	EXPECT_EQ(moved.size(), 1u);
	EXPECT_TRUE(moved.contains(9, "z"));

	copy = m;
	EXPECT_EQ(values_of(copy, 1), (std::vector<std::string>{ "a", "b" }));
	moved = std::move(copy);
	EXPECT_EQ(moved.size(), 3u);
}

TEST_F(fm_multimap, reserve)
{
	counted_multimap<int, int> m;
	m.insert(3, 1);
	m.insert(3, 2);
	m.reserve(1000);
	EXPECT_EQ(m.bucket_count(), 2048u);
	EXPECT_EQ(values_of(m, 3), (std::vector<int>{ 1, 2 }));
	EXPECT_THROW(m.reserve(std::size_t(1) << 40), std::length_error);
}

TEST_F(fm_multimap, random_operations)
{
	std::mt19937 random{ 12345 };
	std::uniform_int_distribution<int> operation_of{ 0, 5 };
	std::uniform_int_distribution<int> key_of{ 0, 63 };
	std::uniform_int_distribution<int> value_of{ 0, 7 };

	// Keys congruent modulo 16 share a group: at most 32 entries per group.
	counted_multimap<int, int, modulo_hash<16>> m;
	std::map<int, std::vector<int>> reference;
	std::size_t reference_size = 0;

	for (int step = 0; step < 20000; ++step)
	{
		const int key = key_of(random);
		const int value = value_of(random);
		std::vector<int>& values = reference[key];
		const auto found = std::find(values.begin(), values.end(), value);
		switch (operation_of(random))
		{
		case 0:
		case 1:
		{
			const bool inserted = found == values.end();
			ASSERT_EQ(m.insert(key, value), inserted) << "step " << step;
			if (inserted)
			{
				values.push_back(value);
				++reference_size;
			}
			break;
		}
		case 2:
		{
			const bool erased = found != values.end();
			ASSERT_EQ(m.erase(key, value), erased) << "step " << step;
			if (erased)
			{
				values.erase(found);
				--reference_size;
			}
			break;
		}
		case 3:
		{
			if (step % 10 == 0)
			{
				ASSERT_EQ(m.erase(key), values.size()) << "step " << step;
				reference_size -= values.size();
				values.clear();
			}
			else
			{
				int first = -1;
				ASSERT_EQ(m.get(key, first), !values.empty()) << "step " << step;
				if (!values.empty())
				{
					ASSERT_EQ(first, values.front()) << "step " << step;
				}
			}
			break;
		}
		case 4:
		{
			const int replacement = value_of(random);
			const bool replaced = found != values.end()
				&& (replacement == value || std::find(values.begin(), values.end(), replacement) == values.end());
			ASSERT_EQ(m.replace(key, value, replacement), replaced) << "step " << step;
			if (replaced)
			{
				*found = replacement;
			}
			break;
		}
		default:
			ASSERT_EQ(values_of(m, key), values) << "step " << step;
			ASSERT_EQ(m.count(key), values.size()) << "step " << step;
			break;
		}
		ASSERT_EQ(m.size(), reference_size) << "step " << step;
		ASSERT_TRUE(robinhood_layout(m)) << "step " << step;
		ASSERT_TRUE(contiguous_groups(m)) << "step " << step;
	}
	for (const auto& [key, values] : reference)
	{
		EXPECT_EQ(values_of(m, key), values);
	}
}
