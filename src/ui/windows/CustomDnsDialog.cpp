#include "ui/windows/CustomDnsDialog.hpp"

#include "core/types/Ipv4Address.hpp"
#include "ui/widgets/Palette.hpp"

#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QVBoxLayout>

namespace nettune::ui {

namespace {

bool isAcceptable(const QLineEdit* edit) {
    return core::isAcceptableIpv4Input(edit->text().trimmed().toStdString());
}

void markField(QLineEdit* edit) {
    if (isAcceptable(edit)) {
        edit->setStyleSheet({});
    } else {
        edit->setStyleSheet(colorStyle(bandColor(core::LatencyBand::Bad)));
    }
}

} // namespace

CustomDnsDialog::CustomDnsDialog(const QString& primary, const QString& secondary,
                                 QWidget* parent)
    : QDialog(parent) {
    setWindowTitle("Custom DNS");
    setupUi();

    primaryEdit_->setText(primary);
    secondaryEdit_->setText(secondary);
    onTextChanged();
}

void CustomDnsDialog::setupUi() {
    auto* layout = new QVBoxLayout(this);

    auto* form = new QFormLayout();
    primaryEdit_ = new QLineEdit(this);
    primaryEdit_->setPlaceholderText("Primary DNS");
    secondaryEdit_ = new QLineEdit(this);
    secondaryEdit_->setPlaceholderText("Secondary DNS");
    form->addRow("Primary:", primaryEdit_);
    form->addRow("Secondary:", secondaryEdit_);
    layout->addLayout(form);

    auto* hint = new QLabel("Example: 8.8.8.8, 1.1.1.1", this);
    hint->setEnabled(false);
    layout->addWidget(hint);

    auto* buttonBox = new QDialogButtonBox(this);
    saveButton_ = buttonBox->addButton("Save", QDialogButtonBox::AcceptRole);
    clearButton_ = buttonBox->addButton("Clear", QDialogButtonBox::ResetRole);
    buttonBox->addButton(QDialogButtonBox::Cancel);
    layout->addWidget(buttonBox);

    connect(primaryEdit_, &QLineEdit::textChanged, this, &CustomDnsDialog::onTextChanged);
    connect(secondaryEdit_, &QLineEdit::textChanged, this, &CustomDnsDialog::onTextChanged);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(clearButton_, &QPushButton::clicked, this, &CustomDnsDialog::onClear);
}

void CustomDnsDialog::onTextChanged() {
    markField(primaryEdit_);
    markField(secondaryEdit_);

    saveButton_->setEnabled(core::isValidIpv4(primary().toStdString()) &&
                            core::isValidIpv4(secondary().toStdString()));
}

void CustomDnsDialog::onClear() {
    primaryEdit_->clear();
    secondaryEdit_->clear();
    primaryEdit_->setFocus();
}

} // namespace nettune::ui
