#include "core/doctrine.h"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace theta_core {

namespace {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

const LockedDoctrine& ReferenceDoctrine() {
  static const LockedDoctrine kReference{
      .version = "v7.4-locked",
      .mfe_threshold = 7.0,
      .trail_offset = 1.5,
      .lws_bars = 4,
      .lws_mfe_threshold = 1.5,
      .defense_sl = 12.0,
      .default_sl = 30.0,
      .take_profit = 20.0,
      .window_bars = 20,
      .short_lookback = 10,
      .depth_slope_bars = 5,
      .terminal_horizon = 10,
      .terminal_fast_ratio = 0.3,
      .burst_range_multiple = 1.8,
      .stb_ratio_short = 1.5,
      .stb_ratio_long = 0.7,
      .stb_channel_short = 80.0,
      .stb_channel_long = 20.0,
      .stb_body_z_floor = 1.0,
      .stb_min_channel_range = 30.0,
      .zone_band_width = 100.0,
      .collapse_loss_streak = 2,
      .retest_min_impulses = 2,
      .retest_max_recovery_bars = 4,
      .max_retry_attempts = 1,
      .max_slippage = 3.0,
      .max_spread = 2.0,
      .size_birth = 1.0,
      .size_transition_retry = 2.0,
      .size_lock_in = 4.0,
      .lock_in_trailing_enabled = true,
  };
  return kReference;
}

std::string CanonicalText(const LockedDoctrine& d) {
  // 文本格式一旦发布即冻结：新增字段只能追加在末尾。
  std::ostringstream oss;
  oss << std::setprecision(10);
  oss << "version=" << d.version << ';'
      << "mfe_threshold=" << d.mfe_threshold << ';'
      << "trail_offset=" << d.trail_offset << ';'
      << "lws_bars=" << d.lws_bars << ';'
      << "lws_mfe_threshold=" << d.lws_mfe_threshold << ';'
      << "defense_sl=" << d.defense_sl << ';'
      << "default_sl=" << d.default_sl << ';'
      << "take_profit=" << d.take_profit << ';'
      << "window_bars=" << d.window_bars << ';'
      << "short_lookback=" << d.short_lookback << ';'
      << "depth_slope_bars=" << d.depth_slope_bars << ';'
      << "terminal_horizon=" << d.terminal_horizon << ';'
      << "terminal_fast_ratio=" << d.terminal_fast_ratio << ';'
      << "burst_range_multiple=" << d.burst_range_multiple << ';'
      << "stb_ratio_short=" << d.stb_ratio_short << ';'
      << "stb_ratio_long=" << d.stb_ratio_long << ';'
      << "stb_channel_short=" << d.stb_channel_short << ';'
      << "stb_channel_long=" << d.stb_channel_long << ';'
      << "stb_body_z_floor=" << d.stb_body_z_floor << ';'
      << "stb_min_channel_range=" << d.stb_min_channel_range << ';'
      << "zone_band_width=" << d.zone_band_width << ';'
      << "collapse_loss_streak=" << d.collapse_loss_streak << ';'
      << "retest_min_impulses=" << d.retest_min_impulses << ';'
      << "retest_max_recovery_bars=" << d.retest_max_recovery_bars << ';'
      << "max_retry_attempts=" << d.max_retry_attempts << ';'
      << "max_slippage=" << d.max_slippage << ';'
      << "max_spread=" << d.max_spread << ';'
      << "size_birth=" << d.size_birth << ';'
      << "size_transition_retry=" << d.size_transition_retry << ';'
      << "size_lock_in=" << d.size_lock_in << ';'
      << "lock_in_trailing_enabled=" << (d.lock_in_trailing_enabled ? 1 : 0);
  return oss.str();
}

bool DoctrineFingerprint(const LockedDoctrine& doctrine,
                         std::string* out_hex,
                         std::string* out_error) {
  if (out_hex == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_hex 为空";
    }
    return false;
  }

  const std::string text = CanonicalText(doctrine);
  EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    if (out_error != nullptr) {
      *out_error = "EVP_MD_CTX_new 失败";
    }
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    if (out_error != nullptr) {
      *out_error = "SHA-256 计算失败";
    }
    return false;
  }

  std::ostringstream oss;
  for (unsigned int i = 0; i < digest_len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(digest[i]);
  }
  *out_hex = oss.str();
  return true;
}

bool VerifyDoctrine(const LockedDoctrine& doctrine,
                    const std::string& expected_version,
                    const std::string& expected_fingerprint,
                    std::string* out_error) {
  if (!expected_version.empty() && expected_version != doctrine.version) {
    if (out_error != nullptr) {
      *out_error = "doctrine 版本不一致: expected=" + expected_version +
                   ", compiled=" + doctrine.version;
    }
    return false;
  }
  if (expected_fingerprint.empty()) {
    return true;
  }

  std::string actual;
  if (!DoctrineFingerprint(doctrine, &actual, out_error)) {
    return false;
  }
  if (actual != expected_fingerprint) {
    if (out_error != nullptr) {
      *out_error = "doctrine 指纹不一致: expected=" + expected_fingerprint +
                   ", compiled=" + actual;
    }
    return false;
  }
  return true;
}

}  // namespace theta_core
