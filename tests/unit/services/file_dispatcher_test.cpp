#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "dsan_core/services/file_dispatcher.hpp"

namespace dsan_core {

using dsan_tests::MockMetadataSanitizer;
using dsan_tests::MockSanitizerFactory;
using dsan_tests::TestUtilities;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Not;
using ::testing::Return;
using ::testing::Throw;

// Dispatcher over mocked sanitizers
class FileDispatcherTest : public dsan_tests::SanitizerTestBase {
 protected:
  void SetUp() override {
    SanitizerTestBase::SetUp();
    mock_factory_ = std::make_shared<MockSanitizerFactory>();
    mock_sanitizer_ = std::make_unique<MockMetadataSanitizer>(logger_);
    output_target_ = std::make_shared<OutputTarget>(output_dir_, input_dir_);
    dispatcher_ = std::make_unique<FileDispatcher>(mock_factory_, output_target_, logger_);

    ON_CALL(*mock_sanitizer_, get_file_type()).WillByDefault(Return(FileType::PDF));
  }

  std::shared_ptr<MockSanitizerFactory> mock_factory_;
  std::unique_ptr<MockMetadataSanitizer> mock_sanitizer_;
  std::shared_ptr<OutputTarget> output_target_;
  std::unique_ptr<FileDispatcher> dispatcher_;
};

TEST_F(FileDispatcherTest, UnsupportedFileIsSkippedWithWarning) {
  auto file = input_dir_ / "notes.txt";
  TestUtilities::write_text_file(file, "plain");
  EXPECT_CALL(*mock_factory_, find_sanitizer_for(file)).WillOnce(Return(nullptr));

  SanitizeResult result = dispatcher_->dispatch(file);

  EXPECT_EQ(result.status, SanitizeStatus::Skipped);
  EXPECT_FALSE(std::filesystem::exists(output_dir_ / "notes.txt"));
  EXPECT_THAT(log_output(), HasSubstr(" - WARNING - Unsupported file type: " + file.string()));
}

TEST_F(FileDispatcherTest, SuccessfulSanitizeReportsOutput) {
  auto file = input_dir_ / "report.pdf";
  auto expected_output = output_dir_ / "report.pdf";
  TestUtilities::write_text_file(file, "input");

  EXPECT_CALL(*mock_factory_, find_sanitizer_for(file)).WillOnce(Return(mock_sanitizer_.get()));
  EXPECT_CALL(*mock_sanitizer_, sanitize(file, FileDispatcher::staging_path_for(expected_output)))
      .WillOnce(Invoke([](const std::filesystem::path&, const std::filesystem::path& destination) {
        TestUtilities::write_text_file(destination, "clean");
      }));

  SanitizeResult result = dispatcher_->dispatch(file);

  ASSERT_TRUE(result.success());
  EXPECT_EQ(result.output_path, expected_output);
  EXPECT_EQ(result.file_type, FileType::PDF);
  EXPECT_EQ(result.output_size, 5u);
  EXPECT_EQ(result.content_hash.size(), 64u);
  EXPECT_FALSE(std::filesystem::exists(FileDispatcher::staging_path_for(expected_output)));
  EXPECT_THAT(log_output(),
              HasSubstr(" - INFO - Sanitized PDF: " + file.string() + " -> " + expected_output.string()));
}

TEST_F(FileDispatcherTest, SanitizerErrorBecomesFailedResult) {
  auto file = input_dir_ / "broken.pdf";
  TestUtilities::write_text_file(file, "input");

  EXPECT_CALL(*mock_factory_, find_sanitizer_for(file)).WillOnce(Return(mock_sanitizer_.get()));
  EXPECT_CALL(*mock_sanitizer_, sanitize(_, _)).WillOnce(Throw(SanitizerError("PDF processing failed: bad xref")));

  SanitizeResult result;
  EXPECT_NO_THROW(result = dispatcher_->dispatch(file));

  EXPECT_EQ(result.status, SanitizeStatus::Failed);
  EXPECT_EQ(result.error_message, "PDF processing failed: bad xref");
  EXPECT_TRUE(result.output_path.empty());
  EXPECT_THAT(log_output(), HasSubstr(" - ERROR - Error processing PDF file " + file.string()));
  EXPECT_THAT(log_output(), HasSubstr("bad xref"));
}

TEST_F(FileDispatcherTest, AnyStdExceptionIsContained) {
  auto file = input_dir_ / "odd.pdf";
  TestUtilities::write_text_file(file, "input");

  EXPECT_CALL(*mock_factory_, find_sanitizer_for(file)).WillOnce(Return(mock_sanitizer_.get()));
  EXPECT_CALL(*mock_sanitizer_, sanitize(_, _)).WillOnce(Throw(std::runtime_error("unexpected")));

  SanitizeResult result = dispatcher_->dispatch(file);
  EXPECT_EQ(result.status, SanitizeStatus::Failed);
}

TEST_F(FileDispatcherTest, FlattenCollisionLogsBothSources) {
  auto first = input_dir_ / "report.pdf";
  auto second = input_dir_ / "sub" / "report.pdf";
  TestUtilities::write_text_file(first, "one");
  TestUtilities::write_text_file(second, "two");

  EXPECT_CALL(*mock_factory_, find_sanitizer_for(_)).WillRepeatedly(Return(mock_sanitizer_.get()));
  EXPECT_CALL(*mock_sanitizer_, sanitize(_, _))
      .Times(2)
      .WillRepeatedly(Invoke([](const std::filesystem::path& source, const std::filesystem::path& destination) {
        std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing);
      }));

  EXPECT_TRUE(dispatcher_->dispatch(first).success());
  EXPECT_THAT(log_output(), Not(HasSubstr("Output collision")));
  EXPECT_TRUE(dispatcher_->dispatch(second).success());

  const std::string log = log_output();
  EXPECT_THAT(log, HasSubstr(" - WARNING - Output collision: "));
  EXPECT_THAT(log, HasSubstr(first.string()));
  EXPECT_THAT(log, HasSubstr("overwritten by " + second.string()));
}

TEST_F(FileDispatcherTest, FailedFileKeepsEarlierOutputAtSameDestination) {
  auto first = input_dir_ / "photo.png";
  auto second = input_dir_ / "sub" / "photo.png";
  auto destination = output_dir_ / "photo.png";
  TestUtilities::write_text_file(first, "good");
  TestUtilities::write_text_file(second, "bad");

  EXPECT_CALL(*mock_factory_, find_sanitizer_for(_)).WillRepeatedly(Return(mock_sanitizer_.get()));
  EXPECT_CALL(*mock_sanitizer_, sanitize(first, _))
      .WillOnce(Invoke([](const std::filesystem::path&, const std::filesystem::path& staging) {
        TestUtilities::write_text_file(staging, "sanitized-first");
      }));
  EXPECT_CALL(*mock_sanitizer_, sanitize(second, _))
      .WillOnce(Throw(SanitizerError("libpng read error: invalid chunk type")));

  ASSERT_TRUE(dispatcher_->dispatch(first).success());
  SanitizeResult failed = dispatcher_->dispatch(second);

  EXPECT_EQ(failed.status, SanitizeStatus::Failed);
  ASSERT_TRUE(std::filesystem::exists(destination));
  std::ifstream kept(destination);
  std::string content((std::istreambuf_iterator<char>(kept)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "sanitized-first");
  EXPECT_FALSE(std::filesystem::exists(FileDispatcher::staging_path_for(destination)));
}

TEST_F(FileDispatcherTest, FailedFileDoesNotCountAsCollidingWriter) {
  auto broken = input_dir_ / "report.pdf";
  auto valid = input_dir_ / "sub" / "report.pdf";
  TestUtilities::write_text_file(broken, "bad");
  TestUtilities::write_text_file(valid, "good");

  EXPECT_CALL(*mock_factory_, find_sanitizer_for(_)).WillRepeatedly(Return(mock_sanitizer_.get()));
  EXPECT_CALL(*mock_sanitizer_, sanitize(broken, _)).WillOnce(Throw(SanitizerError("bad xref")));
  EXPECT_CALL(*mock_sanitizer_, sanitize(valid, _))
      .WillOnce(Invoke([](const std::filesystem::path& source, const std::filesystem::path& staging) {
        std::filesystem::copy_file(source, staging);
      }));

  EXPECT_FALSE(dispatcher_->dispatch(broken).success());
  EXPECT_TRUE(dispatcher_->dispatch(valid).success());

  EXPECT_THAT(log_output(), Not(HasSubstr("Output collision")));
}

TEST_F(FileDispatcherTest, RefusesToOverwriteSource) {
  // Output directory equal to the input directory
  auto same_target = std::make_shared<OutputTarget>(input_dir_, input_dir_);
  FileDispatcher dispatcher(mock_factory_, same_target, logger_);
  auto file = input_dir_ / "report.pdf";
  TestUtilities::write_text_file(file, "input");

  EXPECT_CALL(*mock_factory_, find_sanitizer_for(file)).WillOnce(Return(mock_sanitizer_.get()));
  EXPECT_CALL(*mock_sanitizer_, sanitize(_, _)).Times(0);

  SanitizeResult result = dispatcher.dispatch(file);
  EXPECT_EQ(result.status, SanitizeStatus::Failed);
  EXPECT_THAT(result.error_message, HasSubstr("Refusing to overwrite"));
}

// Dispatcher over the real sanitizers
class FileDispatcherIntegrationTest : public dsan_tests::SanitizerTestBase {
 protected:
  void SetUp() override {
    SanitizerTestBase::SetUp();
    factory_ = std::make_shared<SanitizerFactory>(logger_, SanitizerConfig{});
    output_target_ = std::make_shared<OutputTarget>(output_dir_, input_dir_);
    dispatcher_ = std::make_unique<FileDispatcher>(factory_, output_target_, logger_);
  }

  std::shared_ptr<SanitizerFactory> factory_;
  std::shared_ptr<OutputTarget> output_target_;
  std::unique_ptr<FileDispatcher> dispatcher_;
};

TEST_F(FileDispatcherIntegrationTest, SanitizesEverySupportedFormat) {
  TestUtilities::create_test_pdf(input_dir_ / "a.pdf", 2);
  TestUtilities::create_test_docx(input_dir_ / "b.docx", 2);
  TestUtilities::create_test_png(input_dir_ / "c.png", 4, 4);
  TestUtilities::create_test_jpeg(input_dir_ / "d.jpg", 16, 16);

  for (const std::string name : {"a.pdf", "b.docx", "c.png", "d.jpg"}) {
    SanitizeResult result = dispatcher_->dispatch(input_dir_ / name);
    EXPECT_TRUE(result.success()) << name << ": " << result.error_message;
    EXPECT_TRUE(std::filesystem::exists(output_dir_ / name)) << name;
  }
  EXPECT_EQ(TestUtilities::pdf_page_count(output_dir_ / "a.pdf"), 2u);
  EXPECT_FALSE(TestUtilities::pdf_has_info(output_dir_ / "a.pdf"));
  EXPECT_EQ(TestUtilities::count_docx_elements(output_dir_ / "b.docx", "comment"), 0u);
}

TEST_F(FileDispatcherIntegrationTest, CorruptPdfFailsWithoutOutput) {
  auto file = input_dir_ / "broken.pdf";
  TestUtilities::write_text_file(file, "%PDF-1.4 truncated garbage");

  SanitizeResult result = dispatcher_->dispatch(file);

  EXPECT_EQ(result.status, SanitizeStatus::Failed);
  EXPECT_EQ(result.file_type, FileType::PDF);
  EXPECT_FALSE(std::filesystem::exists(output_dir_ / "broken.pdf"));
}

}  // namespace dsan_core
