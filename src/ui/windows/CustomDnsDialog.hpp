#pragma once

#include <QDialog>
#include <QLineEdit>
#include <QPushButton>

namespace nettune::ui {

/**
 * @brief Dialog editing the primary and secondary servers of the Custom preset.
 *
 * A field turns red while it holds text that is not an IPv4 address. Save is
 * only enabled when both fields are valid addresses.
 */
class CustomDnsDialog : public QDialog {
    Q_OBJECT

public:
    CustomDnsDialog(const QString& primary, const QString& secondary, QWidget* parent = nullptr);

    QString primary() const { return primaryEdit_->text().trimmed(); }
    QString secondary() const { return secondaryEdit_->text().trimmed(); }

private slots:
    void onTextChanged();
    void onClear();

private:
    void setupUi();

    QLineEdit* primaryEdit_{nullptr};
    QLineEdit* secondaryEdit_{nullptr};
    QPushButton* saveButton_{nullptr};
    QPushButton* clearButton_{nullptr};
};

} // namespace nettune::ui
