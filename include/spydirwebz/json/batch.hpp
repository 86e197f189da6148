/**
 * @file batch.hpp
 * @brief 複数のパズルファイルの一括検証
 */
#ifndef SPYDIRWEBZ_JSON_BATCH_HPP
#define SPYDIRWEBZ_JSON_BATCH_HPP

#include "spydirwebz/uniqueness.hpp"
#include "spydirwebz/validator.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace spydirwebz {
namespace json {

/**
 * @brief 一括検証のオプション
 */
struct BatchOptions {
    bool json = false;         // 結果を JSON レコードで出力
    bool print_stats = false;  // 統計情報を err に出力
    bool verbose = false;
    bool count = false;        // 解の数も数える
    unsigned timeout_sec = 0;  // check() 1回あたり（0 = 無制限）
    unsigned workers = 1;
};

struct FileReport {
    ValidationResult result;
    ValidatorStats stats;  // validate() と count_solutions() の合計
    std::optional<EnumerationResult> enumeration;
};

/**
 * @brief 1つのパズルファイルを検証
 *
 * 読み込みや構造の誤りは Malformed の結果に変換する。
 * バックエンド障害だけは例外のまま呼び出し元へ返す。
 *
 * @throws SolverError バックエンド障害
 */
FileReport validate_file(const std::string& filename, const BatchOptions& options);

/**
 * @brief ファイルを検証して入力順に結果を書き出す
 * @return 0 = 全て valid、2 = valid でないものがある、1 = 処理できないファイルがある
 */
int run_batch(const std::vector<std::string>& filenames, const BatchOptions& options,
              std::ostream& out, std::ostream& err);

/**
 * @brief 10進の符号なし整数を読む
 * @return 数字以外を含む、空、または max を超える場合 false
 */
bool parse_unsigned(const char* text, unsigned max, unsigned& value);

} // namespace json
} // namespace spydirwebz

#endif // SPYDIRWEBZ_JSON_BATCH_HPP
