/*
 * Arbor - Nested Sets Tree Storage
 * Copyright (C) 2026 Arbor Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "JSONUtils.hpp"
#include "Logger.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace Arbor {
	namespace Utils {
		namespace JSON {

			namespace {
				void setError(Error* err, std::string msg, const std::filesystem::path& path = {},
				              size_t offset = 0) {
					if (!err) return;
					err->message = std::move(msg);
					err->path = path;
					err->byteOffset = offset;
				}

				// nlohmann enforces no depth limit of its own; walk the parse events instead
				Json::parser_callback_t depthGuard(size_t maxDepth, bool& exceeded) {
					return [maxDepth, &exceeded](int depth, Json::parse_event_t, Json&) {
						if (static_cast<size_t>(depth) > maxDepth) {
							exceeded = true;
						}
						return true;
					};
				}
			} // anonymous namespace

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				try {
					bool tooDeep = false;
					Json parsed = Json::parse(jsonText.begin(), jsonText.end(),
						depthGuard(opt.maxDepth, tooDeep),
						/*allow_exceptions=*/true,
						/*ignore_comments=*/opt.allowComments);

					if (tooDeep) {
						out = Json();
						setError(err, "JSON nesting exceeds maximum depth of " + std::to_string(opt.maxDepth));
						return false;
					}

					out = std::move(parsed);
					return true;
				}
				catch (const nlohmann::json::parse_error& ex) {
					out = Json();
					setError(err, ex.what(), {}, ex.byte);
					return false;
				}
				catch (const std::exception& ex) {
					out = Json();
					setError(err, ex.what());
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = opt.pretty ? j.dump(opt.indentSpaces) : j.dump();
					return true;
				}
				catch (const nlohmann::json::exception& ex) {
					AR_LOG_ERROR("JSON", "Stringify failed: %s", ex.what());
					return false;
				}
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						setError(err, "Cannot stat file: " + ec.message(), path);
						return false;
					}
					if (size > maxBytes) {
						setError(err, "File exceeds maximum size of " + std::to_string(maxBytes) + " bytes", path);
						return false;
					}

					std::ifstream in(path, std::ios::binary);
					if (!in) {
						setError(err, "Cannot open file", path);
						return false;
					}

					std::ostringstream buffer;
					buffer << in.rdbuf();
					std::string text = buffer.str();

					// UTF-8 BOM
					if (text.size() >= 3 &&
						static_cast<unsigned char>(text[0]) == 0xEF &&
						static_cast<unsigned char>(text[1]) == 0xBB &&
						static_cast<unsigned char>(text[2]) == 0xBF) {
						text.erase(0, 3);
					}

					if (!Parse(text, out, err, opt)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::exception& ex) {
					setError(err, ex.what(), path);
					return false;
				}
			}

			bool SaveToFile(const std::filesystem::path& path, const Json& j, Error* err,
			                const StringifyOptions& opt) noexcept {
				try {
					std::string text;
					if (!Stringify(j, text, opt)) {
						setError(err, "Serialization failed", path);
						return false;
					}

					std::error_code ec;
					if (path.has_parent_path()) {
						std::filesystem::create_directories(path.parent_path(), ec);
					}

					auto tmp = path;
					tmp += ".tmp";
					{
						std::ofstream outFile(tmp, std::ios::binary | std::ios::trunc);
						if (!outFile) {
							setError(err, "Cannot open temporary file", tmp);
							return false;
						}
						outFile << text;
						if (!outFile) {
							setError(err, "Write failed", tmp);
							return false;
						}
					}

					std::filesystem::rename(tmp, path, ec);
					if (ec) {
						std::filesystem::remove(tmp, ec);
						setError(err, "Atomic replace failed", path);
						return false;
					}
					return true;
				}
				catch (const std::exception& ex) {
					setError(err, ex.what(), path);
					return false;
				}
			}

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty()) return "/";
					if (pathLike.front() == '/') return std::string(pathLike);

					auto escape = [](const std::string& tok) {
						std::string outTok;
						for (const char c : tok) {
							if (c == '~') outTok += "~0";
							else if (c == '/') outTok += "~1";
							else outTok += c;
						}
						return outTok;
					};

					std::string pointer;
					std::string token;
					for (size_t i = 0; i < pathLike.size(); ++i) {
						const char c = pathLike[i];
						if (c == '.') {
							if (!token.empty()) {
								pointer += "/" + escape(token);
								token.clear();
							}
						}
						else if (c == '[') {
							if (!token.empty()) {
								pointer += "/" + escape(token);
								token.clear();
							}
							const size_t close = pathLike.find(']', i);
							if (close == std::string_view::npos) {
								token.assign(pathLike.substr(i + 1));
								i = pathLike.size();
							}
							else {
								pointer += "/" + escape(std::string(pathLike.substr(i + 1, close - i - 1)));
								i = close;
							}
						}
						else {
							token += c;
						}
					}
					if (!token.empty()) {
						pointer += "/" + escape(token);
					}
					return pointer.empty() ? "/" : pointer;
				}
				catch (const std::exception&) {
					return "/";
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp == "/") return true;
					return j.contains(nlohmann::json::json_pointer(jp));
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace Arbor
