/*  This file is part of Blinkery, a library for simulating small FPGA designs.
	Copyright (C) 2023 Michael Offel, Andreas Ley

	Blinkery is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Blinkery is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include "Exceptions.h"
#include "Preprocessor.h"

#include <yaml-cpp/yaml.h>

#include <boost/lexical_cast.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <filesystem>
#include <vector>

namespace blk::utils
{
	std::optional<std::string_view> globbingMatchPath(std::string_view pattern, std::string_view str);
	std::string replaceEnvVars(const std::string& src);

	/**
	 * @brief Read only view onto one or more stacked yaml documents.
	 * @details Lookups walk the documents from the most recently loaded to the first one, so later files override earlier ones.
	 * Map keys may contain '*' globs which match any part of a '/' separated lookup path.
	 */
	class ConfigTree 
	{
	public:
		struct iterator {
			const ConfigTree& src;
			YAML::Node::const_iterator it;

			void operator++() { ++it; }
			ConfigTree operator*() { return ConfigTree(*it); }
			bool operator==(const iterator& rhs) const { return it == rhs.it; }
			bool operator!=(const iterator& rhs) const { return it != rhs.it; }
		};

		struct map_iterator
		{
			const ConfigTree& src;
			YAML::Node::const_iterator it;

			void operator++() { ++it; }
			ConfigTree operator*() { return ConfigTree(it->second); }
			bool operator==(const map_iterator& rhs) const { return it == rhs.it; }
			bool operator!=(const map_iterator& rhs) const { return it != rhs.it; }

			std::string key() const { return it->first.as<std::string>(); }
		};

	public:
		ConfigTree() = default;
		ConfigTree(YAML::Node node);

		explicit operator bool() const { return isDefined(); }
		bool isDefined() const;
		bool isNull() const;
		bool isScalar() const;
		bool isSequence() const;
		bool isMap() const;

		map_iterator mapBegin() const;
		map_iterator mapEnd() const;

		iterator begin() const;
		iterator end() const;
		size_t size() const;
		ConfigTree operator[](size_t index) const;

		ConfigTree operator[](std::string_view path) const;
		template<typename T> T as(const T& def) const;
		template<typename T> T as() const;

		void loadFromFile(const std::filesystem::path &filename);
		void loadFromString(const std::string &yaml);

	protected:
		std::vector<YAML::Node> m_nodes;

		std::string scalarText() const;
		std::string location() const;
	};

	template<typename T>
	inline T ConfigTree::as(const T& def) const
	{
		if (m_nodes.size() != 1)
			return def;

		return as<T>();
	}

	template<typename T>
	inline T ConfigTree::as() const
	{
		BLK_CONFIGCHECK_HINT(m_nodes.size() == 1, "non optional config value not found");

		try {
			return m_nodes.front().as<T>();
		} catch (const YAML::BadConversion &) {
			auto str = scalarText();
			BLK_CONFIGCHECK_HINT(!str.empty() && str[0] == '$', "config value '" + str + "'" + location() + " has the wrong type");
			str = replaceEnvVars(str);
			if constexpr (std::is_same_v<T, bool>) {
				if (str == "false" || str == "No")
					return false;
				if (str == "true" || str == "Yes")
					return true;
				BLK_CONFIGCHECK_HINT(false, "environment variable expanded to '" + str + "' which is not a boolean");
			} else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
				try {
					return boost::lexical_cast<T>(str);
				} catch (const boost::bad_lexical_cast &) {
					BLK_CONFIGCHECK_HINT(false, "environment variable expanded to '" + str + "' which is not a number");
				}
			} else {
				BLK_CONFIGCHECK_HINT(false, "environment variables are not supported for this config value");
			}
		}
		return {};
	}

	template<>
	inline std::string ConfigTree::as(const std::string& def) const
	{
		if (m_nodes.size() != 1)
			return def;
		return replaceEnvVars(scalarText());
	}

	template<>
	inline std::string ConfigTree::as() const
	{
		BLK_CONFIGCHECK_HINT(m_nodes.size() == 1, "non optional config value not found");
		return replaceEnvVars(scalarText());
	}
}
