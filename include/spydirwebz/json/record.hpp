/**
 * @file record.hpp
 * @brief パズルレコードの読み込みと検証結果レコードの書き出し
 */
#ifndef SPYDIRWEBZ_JSON_RECORD_HPP
#define SPYDIRWEBZ_JSON_RECORD_HPP

#include "spydirwebz/puzzle.hpp"
#include "spydirwebz/validator.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace spydirwebz {
namespace json {

/**
 * @brief JSON 値をパズルに変換
 *
 * 手がかりは明示的な参照（actor / vector / asset / data）を優先し、
 * なければ text から復元する。変換後に check_puzzle() を通すので、
 * 返る Puzzle は常に構造的不変条件を満たす。
 *
 * @throws MalformedPuzzle 欠けたフィールド、型の誤り、不変条件の違反
 */
Puzzle to_puzzle(const nlohmann::json& record);

/**
 * @brief JSON ファイルからパズルを読み込む
 * @throws std::runtime_error ファイルが読めない、またはパースエラー時
 * @throws MalformedPuzzle レコードが不正な場合
 */
Puzzle load_puzzle(const std::string& filename);

/**
 * @brief JSON 文字列からパズルを読み込む
 */
Puzzle parse_puzzle(const std::string& input);

/**
 * @brief 検証結果を JSON オブジェクトに変換
 * @param file 入力ファイル名（空なら "file" キーを含めない）
 */
nlohmann::json to_json(const ValidationResult& result, const std::string& file = "");

/**
 * @brief 検証結果を1行の JSON として書き出す
 */
void write_result(std::ostream& out, const ValidationResult& result,
                  const std::string& file = "");

} // namespace json
} // namespace spydirwebz

#endif // SPYDIRWEBZ_JSON_RECORD_HPP
