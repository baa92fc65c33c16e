//
//  pipeline_errors.hpp
//  motion_comic
//

#ifndef pipeline_errors_hpp
#define pipeline_errors_hpp

#include <stdexcept>
#include <string>

//パイプラインの例外基底　どのステージで失敗したかを持つ
class PipelineError : public std::runtime_error
{
public:
    PipelineError(const std::string &stage, const std::string &message)
        : std::runtime_error(stage + ": " + message), stage_name(stage) {}

    const std::string &stage() const { return stage_name; }

private:
    std::string stage_name;
};

//非対応のアーカイブ形式・読めない画像
class UnsupportedFormatError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

//ページやコマが一つもない
class EmptyInputError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

//ステージの前提条件違反
class PipelineStateError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

//ページからコマが検出されなかった（ページ全体をコマとして扱える）
class RegionDetectionEmpty : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

//TTS/OCRの失敗
class SynthesisFailure : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

//エンコーダの失敗
class EncodingFailure : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

class PipelineCancelled : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

#endif /* pipeline_errors_hpp */
